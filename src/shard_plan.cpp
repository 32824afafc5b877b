#include <shardrt/core/shard_plan.hpp>

#include <sstream>

namespace shardrt::core {

namespace {

std::vector<plan_entry> plan_unbound(const plan_options& options)
{
    const std::size_t count = options.shard_count.value_or(1);
    if (count == 0) {
        throw plan_error(plan_errc::invalid_config, "shard count must be at least 1");
    }

    std::vector<plan_entry> plan(count);
    for (std::size_t i = 0; i < count; ++i) {
        plan[i].shard_index = i;
    }
    return plan;
}

std::vector<plan_entry> plan_core_only(const support::topology& topo, const plan_options& options)
{
    const core_set cores = topo.all_cores();
    if (cores.empty()) {
        throw plan_error(plan_errc::empty_topology, "topology has no cores to plan over");
    }

    const std::size_t count = options.shard_count.value_or(cores.size());
    if (count == 0) {
        throw plan_error(plan_errc::invalid_config, "shard count must be at least 1");
    }
    if (count > cores.size()) {
        throw plan_error(plan_errc::insufficient_cores,
                         "requested " + std::to_string(count) + " shards but only " +
                             std::to_string(cores.size()) + " cores are available");
    }

    auto groups = split_even(cores, count);
    std::vector<plan_entry> plan(count);
    for (std::size_t i = 0; i < count; ++i) {
        plan[i].shard_index = i;
        plan[i].bound_cores = std::move(groups[i]);
    }
    return plan;
}

std::vector<plan_entry> plan_numa_aware(const support::topology& topo, const plan_options& options)
{
    const std::size_t per_node = options.workers_per_numa;
    if (per_node == 0) {
        throw plan_error(plan_errc::invalid_config, "workers_per_numa must be at least 1");
    }
    if (topo.node_count() == 0) {
        throw plan_error(plan_errc::empty_topology, "topology has no numa nodes");
    }

    // Validate every node before producing anything.
    for (const auto& node : topo.nodes()) {
        if (node.cores.size() < per_node) {
            throw plan_error(plan_errc::empty_node,
                             "numa node " + std::to_string(node.id) + " has " +
                                 std::to_string(node.cores.size()) + " cores, cannot host " +
                                 std::to_string(per_node) + " shards");
        }
    }

    std::vector<plan_entry> plan;
    plan.reserve(topo.node_count() * per_node);
    for (const auto& node : topo.nodes()) {
        for (auto& group : split_even(node.cores, per_node)) {
            plan_entry entry;
            entry.shard_index = plan.size();
            entry.bound_cores = std::move(group);
            entry.numa_node = node.id;
            plan.push_back(std::move(entry));
        }
    }
    return plan;
}

} // namespace

const char* to_string(affinity_mode mode) noexcept
{
    switch (mode) {
    case affinity_mode::none:
        return "none";
    case affinity_mode::core_only:
        return "core_only";
    case affinity_mode::numa_aware:
        return "numa_aware";
    }
    return "unknown";
}

std::vector<core_set> split_even(const core_set& cores, std::size_t parts)
{
    std::vector<core_set> groups(parts);
    if (parts == 0) return groups;

    const std::size_t base = cores.size() / parts;
    const std::size_t extra = cores.size() % parts;

    std::size_t next = 0;
    for (std::size_t i = 0; i < parts; ++i) {
        const std::size_t n = base + (i < extra ? 1 : 0);
        groups[i].assign(cores.begin() + static_cast<std::ptrdiff_t>(next),
                         cores.begin() + static_cast<std::ptrdiff_t>(next + n));
        next += n;
    }
    return groups;
}

std::vector<plan_entry> make_plan(const support::topology& topo, const plan_options& options)
{
    switch (options.mode) {
    case affinity_mode::none:
        return plan_unbound(options);
    case affinity_mode::core_only:
        return plan_core_only(topo, options);
    case affinity_mode::numa_aware:
        return plan_numa_aware(topo, options);
    }
    throw plan_error(plan_errc::invalid_config, "unknown affinity mode");
}

std::string to_string(const plan_entry& entry)
{
    std::ostringstream os;
    os << "shard " << entry.shard_index << ": ";
    if (entry.numa_node) {
        os << "node " << *entry.numa_node << ", ";
    }
    if (entry.bound_cores.empty()) {
        os << "unbound";
    } else {
        os << "cores {";
        for (std::size_t i = 0; i < entry.bound_cores.size(); ++i) {
            if (i) os << ',';
            os << entry.bound_cores[i];
        }
        os << '}';
    }
    return os.str();
}

} // namespace shardrt::core
