#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace shardrt::support {

using core_id = unsigned;
using node_id = unsigned;

// Always kept sorted ascending and free of duplicates.
using core_set = std::vector<core_id>;

struct numa_node {
    node_id  id = 0;
    core_set cores;
};

enum class topology_errc {
    unsupported, // the platform cannot enumerate NUMA nodes
    invalid,     // a hand-built description violates the topology invariants
};

class topology_error : public std::runtime_error {
public:
    topology_error(topology_errc code, const std::string& what)
        : std::runtime_error(what)
        , code_(code)
    {}

    topology_errc code() const noexcept { return code_; }

private:
    topology_errc code_;
};

// Static description of the cores available to the process and the NUMA
// node each of them belongs to. Nodes keep the order they were given in;
// the cores of every node are normalized to ascending order.
//
// Construction throws topology_error(invalid) when a core id is listed in
// more than one node or two nodes share an id. Nodes without cores are
// allowed (memory-only nodes exist) and simply own nothing.
class topology {
public:
    topology() = default;
    explicit topology(std::vector<numa_node> nodes);

    const std::vector<numa_node>& nodes() const noexcept { return nodes_; }

    std::size_t node_count() const noexcept { return nodes_.size(); }
    std::size_t core_count() const noexcept;
    bool empty() const noexcept { return core_count() == 0; }

    // Every core of every node, ascending.
    core_set all_cores() const;

    bool contains(core_id core) const noexcept;
    std::optional<node_id> node_of(core_id core) const noexcept;

    // Copy of this topology with `reserved` removed from every node. Reserved
    // ids that are not part of the topology are ignored.
    topology without(const core_set& reserved) const;

    std::string to_string() const;

private:
    std::vector<numa_node> nodes_;
};

// Normalize an arbitrary list of core ids into a core_set.
core_set make_core_set(std::vector<core_id> cores);

// Query the machine through libnuma. Only cores in the process' allowed
// CPU set are reported and nodes without usable cores are dropped.
// Throws topology_error(unsupported) when libnuma reports NUMA unavailable
// or on platforms without libnuma.
[[nodiscard]] topology discover_topology();

// True when discover_topology() can be expected to succeed.
[[nodiscard]] bool numa_supported() noexcept;

// Cores the calling thread may currently run on (sched_getaffinity). Falls
// back to 0..hardware_concurrency-1 where the query is unavailable.
[[nodiscard]] core_set allowed_cores();

// Degenerate one-node topology used when NUMA discovery is unavailable.
[[nodiscard]] topology single_node_topology(core_set cores);
[[nodiscard]] topology single_node_topology(std::size_t core_count);

} // namespace shardrt::support
