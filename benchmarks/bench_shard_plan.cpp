#include <benchmark/benchmark.h>

#include <vector>

#include <shardrt/core/shard_plan.hpp>
#include <shardrt/support/cpu_topology.hpp>

namespace {

shardrt::support::topology make_topology(std::size_t nodes, std::size_t cores_each)
{
    std::vector<shardrt::support::numa_node> list(nodes);
    unsigned next = 0;
    for (std::size_t n = 0; n < nodes; ++n) {
        list[n].id = static_cast<unsigned>(n);
        for (std::size_t c = 0; c < cores_each; ++c) list[n].cores.push_back(next++);
    }
    return shardrt::support::topology{std::move(list)};
}

static void BM_PlanCoreOnly(benchmark::State& state)
{
    const auto topo = make_topology(1, static_cast<std::size_t>(state.range(0)));
    shardrt::core::plan_options options;
    options.mode = shardrt::core::affinity_mode::core_only;

    for (auto _ : state) {
        auto plan = shardrt::core::make_plan(topo, options);
        benchmark::DoNotOptimize(plan.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_PlanCoreOnly)->Arg(8)->Arg(64)->Arg(256);

static void BM_PlanNumaAware(benchmark::State& state)
{
    const auto nodes = static_cast<std::size_t>(state.range(0));
    const auto topo = make_topology(nodes, 32);
    shardrt::core::plan_options options;
    options.mode = shardrt::core::affinity_mode::numa_aware;
    options.workers_per_numa = 4;

    for (auto _ : state) {
        auto plan = shardrt::core::make_plan(topo, options);
        benchmark::DoNotOptimize(plan.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * 4);
}

BENCHMARK(BM_PlanNumaAware)->Arg(1)->Arg(2)->Arg(8);

static void BM_TopologyWithout(benchmark::State& state)
{
    const auto topo = make_topology(4, static_cast<std::size_t>(state.range(0)));
    const shardrt::support::core_set reserved{0, 1};

    for (auto _ : state) {
        auto trimmed = topo.without(reserved);
        benchmark::DoNotOptimize(trimmed.core_count());
    }
}

BENCHMARK(BM_TopologyWithout)->Arg(16)->Arg(64);

} // namespace
