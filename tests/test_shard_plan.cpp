#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include <shardrt/core/shard_plan.hpp>

namespace {

using shardrt::core::affinity_mode;
using shardrt::core::make_plan;
using shardrt::core::plan_entry;
using shardrt::core::plan_errc;
using shardrt::core::plan_error;
using shardrt::core::plan_options;
using shardrt::support::core_set;
using shardrt::support::numa_node;
using shardrt::support::topology;

topology make_topology(const std::vector<std::size_t>& cores_per_node)
{
    std::vector<numa_node> nodes;
    unsigned next = 0;
    for (std::size_t n = 0; n < cores_per_node.size(); ++n) {
        numa_node node;
        node.id = static_cast<unsigned>(n);
        for (std::size_t c = 0; c < cores_per_node[n]; ++c) node.cores.push_back(next++);
        nodes.push_back(std::move(node));
    }
    return topology{std::move(nodes)};
}

plan_options numa_options(std::size_t per_node)
{
    plan_options o;
    o.mode = affinity_mode::numa_aware;
    o.workers_per_numa = per_node;
    return o;
}

plan_options core_options(std::optional<std::size_t> shards = std::nullopt)
{
    plan_options o;
    o.mode = affinity_mode::core_only;
    o.shard_count = shards;
    return o;
}

void expect_disjoint_subset(const std::vector<plan_entry>& plan, const topology& topo)
{
    std::set<unsigned> seen;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        EXPECT_EQ(plan[i].shard_index, i);
        for (auto core : plan[i].bound_cores) {
            EXPECT_TRUE(topo.contains(core)) << "core " << core;
            EXPECT_TRUE(seen.insert(core).second) << "core " << core << " planned twice";
        }
    }
}

plan_errc plan_failure(const topology& topo, const plan_options& options)
{
    try {
        (void)make_plan(topo, options);
    } catch (const plan_error& ex) {
        return ex.code();
    }
    ADD_FAILURE() << "plan unexpectedly succeeded";
    return plan_errc::invalid_config;
}

TEST(NumaAwarePlan, TwoNodesOfFourWithTwoWorkersEach)
{
    auto topo = make_topology({4, 4});
    auto plan = make_plan(topo, numa_options(2));

    ASSERT_EQ(plan.size(), 4u);
    EXPECT_EQ(plan[0].bound_cores, (core_set{0, 1}));
    EXPECT_EQ(plan[1].bound_cores, (core_set{2, 3}));
    EXPECT_EQ(plan[2].bound_cores, (core_set{4, 5}));
    EXPECT_EQ(plan[3].bound_cores, (core_set{6, 7}));

    EXPECT_EQ(plan[0].numa_node, 0u);
    EXPECT_EQ(plan[1].numa_node, 0u);
    EXPECT_EQ(plan[2].numa_node, 1u);
    EXPECT_EQ(plan[3].numa_node, 1u);
    expect_disjoint_subset(plan, topo);
}

TEST(NumaAwarePlan, RemainderGoesToEarliestEntriesOfEachNode)
{
    auto topo = make_topology({7, 5, 3});
    auto plan = make_plan(topo, numa_options(3));

    ASSERT_EQ(plan.size(), 9u);
    std::map<unsigned, std::vector<std::size_t>> sizes_by_node;
    for (const auto& entry : plan) {
        sizes_by_node[*entry.numa_node].push_back(entry.bound_cores.size());
    }
    EXPECT_EQ(sizes_by_node[0], (std::vector<std::size_t>{3, 2, 2}));
    EXPECT_EQ(sizes_by_node[1], (std::vector<std::size_t>{2, 2, 1}));
    EXPECT_EQ(sizes_by_node[2], (std::vector<std::size_t>{1, 1, 1}));
    expect_disjoint_subset(plan, topo);
}

TEST(NumaAwarePlan, EveryNodeIsPartitionedWithinOneCore)
{
    const std::vector<std::vector<std::size_t>> shapes = {
        {1}, {8}, {3, 9}, {16, 16}, {5, 6, 7, 8}, {2, 13, 4},
    };
    for (const auto& shape : shapes) {
        auto topo = make_topology(shape);
        const std::size_t smallest = *std::min_element(shape.begin(), shape.end());
        for (std::size_t w = 1; w <= smallest; ++w) {
            auto plan = make_plan(topo, numa_options(w));
            EXPECT_EQ(plan.size(), shape.size() * w);
            expect_disjoint_subset(plan, topo);

            for (const auto& node : topo.nodes()) {
                std::size_t lo = SIZE_MAX, hi = 0, total = 0;
                for (const auto& entry : plan) {
                    if (entry.numa_node != node.id) continue;
                    lo = std::min(lo, entry.bound_cores.size());
                    hi = std::max(hi, entry.bound_cores.size());
                    total += entry.bound_cores.size();
                    for (auto core : entry.bound_cores) {
                        EXPECT_EQ(topo.node_of(core), node.id);
                    }
                }
                EXPECT_LE(hi - lo, 1u);
                EXPECT_GE(lo, 1u);
                EXPECT_EQ(total, node.cores.size());
            }
        }
    }
}

TEST(NumaAwarePlan, DensityAboveSmallestNodeFailsWithEmptyNode)
{
    EXPECT_EQ(plan_failure(make_topology({4}), numa_options(5)), plan_errc::empty_node);
    EXPECT_EQ(plan_failure(make_topology({1}), numa_options(2)), plan_errc::empty_node);
    EXPECT_EQ(plan_failure(make_topology({8, 2}), numa_options(3)), plan_errc::empty_node);
    EXPECT_EQ(plan_failure(make_topology({4, 4, 4}), numa_options(64)), plan_errc::empty_node);
}

TEST(NumaAwarePlan, ZeroWorkersPerNodeIsInvalid)
{
    EXPECT_EQ(plan_failure(make_topology({4}), numa_options(0)), plan_errc::invalid_config);
}

TEST(NumaAwarePlan, NodeEmptiedByReservationFails)
{
    auto topo = make_topology({2, 2}).without({2, 3});
    EXPECT_EQ(plan_failure(topo, numa_options(1)), plan_errc::empty_node);
}

TEST(CoreOnlyPlan, DefaultsToOneShardPerCore)
{
    auto topo = make_topology({8});
    auto plan = make_plan(topo, core_options());

    ASSERT_EQ(plan.size(), 8u);
    for (std::size_t i = 0; i < plan.size(); ++i) {
        EXPECT_EQ(plan[i].bound_cores, (core_set{static_cast<unsigned>(i)}));
        EXPECT_FALSE(plan[i].numa_node.has_value());
    }
}

TEST(CoreOnlyPlan, ShardsCoverEveryCoreExactlyOnce)
{
    for (std::size_t cores : {1u, 7u, 8u, 13u}) {
        auto topo = make_topology({cores / 2, cores - cores / 2});
        for (std::size_t k = 1; k <= cores; ++k) {
            auto plan = make_plan(topo, core_options(k));
            ASSERT_EQ(plan.size(), k);
            expect_disjoint_subset(plan, topo);

            std::size_t total = 0;
            for (const auto& entry : plan) {
                EXPECT_GE(entry.bound_cores.size(), cores / k);
                EXPECT_LE(entry.bound_cores.size(), cores / k + 1);
                total += entry.bound_cores.size();
            }
            EXPECT_EQ(total, cores);
        }
    }
}

TEST(CoreOnlyPlan, GroupsAreContiguousAcrossNodeBoundaries)
{
    auto topo = make_topology({3, 3});
    auto plan = make_plan(topo, core_options(2));

    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan[0].bound_cores, (core_set{0, 1, 2}));
    EXPECT_EQ(plan[1].bound_cores, (core_set{3, 4, 5}));
}

TEST(CoreOnlyPlan, OrderFollowsCoreIdNotNodeOrder)
{
    std::vector<numa_node> nodes(2);
    nodes[0].id = 1;
    nodes[0].cores = {6, 4};
    nodes[1].id = 0;
    nodes[1].cores = {1, 0};
    topology topo{std::move(nodes)};

    auto plan = make_plan(topo, core_options(2));
    EXPECT_EQ(plan[0].bound_cores, (core_set{0, 1}));
    EXPECT_EQ(plan[1].bound_cores, (core_set{4, 6}));
}

TEST(CoreOnlyPlan, ReservedCoresAreNeverPlanned)
{
    auto topo = make_topology({4, 4}).without({0, 4});
    auto plan = make_plan(topo, core_options());

    ASSERT_EQ(plan.size(), 6u);
    for (const auto& entry : plan) {
        EXPECT_NE(entry.bound_cores.front(), 0u);
        EXPECT_NE(entry.bound_cores.front(), 4u);
    }
}

TEST(CoreOnlyPlan, MoreShardsThanCoresFails)
{
    EXPECT_EQ(plan_failure(make_topology({2, 2}), core_options(5)), plan_errc::insufficient_cores);
    EXPECT_EQ(plan_failure(topology{}, core_options()), plan_errc::empty_topology);
    EXPECT_EQ(plan_failure(make_topology({2}), core_options(0)), plan_errc::invalid_config);
}

TEST(UnboundPlan, SingleEntryWithoutCores)
{
    plan_options o;
    o.mode = affinity_mode::none;

    auto plan = make_plan(make_topology({4}), o);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_TRUE(plan[0].unbound());

    o.shard_count = 3;
    plan = make_plan(topology{}, o);
    ASSERT_EQ(plan.size(), 3u);
    for (const auto& entry : plan) EXPECT_TRUE(entry.unbound());
}

TEST(Plan, IdenticalInputsGiveIdenticalPlans)
{
    auto topo = make_topology({6, 6});
    auto a = make_plan(topo, numa_options(4));
    auto b = make_plan(topo, numa_options(4));

    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].shard_index, b[i].shard_index);
        EXPECT_EQ(a[i].bound_cores, b[i].bound_cores);
        EXPECT_EQ(a[i].numa_node, b[i].numa_node);
    }
}

TEST(Plan, DescribesEntries)
{
    auto plan = make_plan(make_topology({4}), numa_options(2));
    EXPECT_EQ(shardrt::core::to_string(plan[1]), "shard 1: node 0, cores {2,3}");
}

} // namespace
