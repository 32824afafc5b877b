#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <shardrt/support/cpu_topology.hpp>

namespace shardrt::core {

using support::core_id;
using support::core_set;
using support::node_id;

enum class affinity_mode {
    none,       // one unbound shard (unless a count is requested)
    core_only,  // disjoint contiguous core groups, node boundaries ignored
    numa_aware, // workers_per_numa shards carved out of every node
};

[[nodiscard]] const char* to_string(affinity_mode mode) noexcept;

enum class plan_errc {
    empty_node,         // a node has fewer cores than shards requested on it
    empty_topology,     // no cores left to plan over
    insufficient_cores, // more core-only shards than cores
    invalid_config,     // zero shards / zero workers per node / bad override
};

class plan_error : public std::runtime_error {
public:
    plan_error(plan_errc code, const std::string& what)
        : std::runtime_error(what)
        , code_(code)
    {}

    plan_errc code() const noexcept { return code_; }

private:
    plan_errc code_;
};

struct plan_entry {
    std::size_t            shard_index = 0;
    core_set               bound_cores; // empty == no affinity
    std::optional<node_id> numa_node;

    bool unbound() const noexcept { return bound_cores.empty() && !numa_node; }
};

// Planning inputs. `shard_count` is the caller override used by the none
// and core_only modes; nullopt means one shard per core for core_only and a
// single shard for none.
struct plan_options {
    affinity_mode              mode = affinity_mode::core_only;
    std::size_t                workers_per_numa = 1;
    std::optional<std::size_t> shard_count;
};

// Pure function of its inputs: identical topology and options always give
// the identical plan. Entries are ordered by shard_index, bound_cores sets
// are pairwise disjoint and drawn from `topo`. Throws plan_error.
[[nodiscard]] std::vector<plan_entry> make_plan(const support::topology& topo, const plan_options& options);

// Split `cores` (ascending) into `parts` contiguous runs whose sizes differ
// by at most one, larger runs first. Requires 0 < parts <= cores.size().
[[nodiscard]] std::vector<core_set> split_even(const core_set& cores, std::size_t parts);

std::string to_string(const plan_entry& entry);

} // namespace shardrt::core
