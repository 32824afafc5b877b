#include <shardrt/support/cpu_topology.hpp>

#include <algorithm>
#include <memory>
#include <sstream>
#include <thread>
#include <unordered_set>

#if defined(__linux__)
#include <numa.h>
#include <pthread.h>
#include <sched.h>
#endif

namespace shardrt::support {

namespace {

#if defined(__linux__)
struct cpumask_deleter {
    void operator()(struct bitmask* mask) const noexcept { ::numa_free_cpumask(mask); }
};

using cpumask_ptr = std::unique_ptr<struct bitmask, cpumask_deleter>;
#endif

core_set hardware_concurrency_cores()
{
    unsigned n = std::thread::hardware_concurrency();
    if (n == 0) n = 1;
    core_set cores(n);
    for (unsigned i = 0; i < n; ++i) cores[i] = i;
    return cores;
}

} // namespace

core_set make_core_set(std::vector<core_id> cores)
{
    std::sort(cores.begin(), cores.end());
    cores.erase(std::unique(cores.begin(), cores.end()), cores.end());
    return cores;
}

topology::topology(std::vector<numa_node> nodes)
    : nodes_(std::move(nodes))
{
    std::unordered_set<node_id> node_ids;
    std::unordered_set<core_id> seen;
    for (auto& node : nodes_) {
        if (!node_ids.insert(node.id).second) {
            throw topology_error(topology_errc::invalid,
                                 "numa node " + std::to_string(node.id) + " listed twice");
        }
        std::sort(node.cores.begin(), node.cores.end());
        for (core_id core : node.cores) {
            if (!seen.insert(core).second) {
                throw topology_error(topology_errc::invalid,
                                     "core " + std::to_string(core) + " listed more than once");
            }
        }
    }
}

std::size_t topology::core_count() const noexcept
{
    std::size_t n = 0;
    for (const auto& node : nodes_) n += node.cores.size();
    return n;
}

core_set topology::all_cores() const
{
    core_set cores;
    cores.reserve(core_count());
    for (const auto& node : nodes_) {
        cores.insert(cores.end(), node.cores.begin(), node.cores.end());
    }
    std::sort(cores.begin(), cores.end());
    return cores;
}

bool topology::contains(core_id core) const noexcept
{
    return node_of(core).has_value();
}

std::optional<node_id> topology::node_of(core_id core) const noexcept
{
    for (const auto& node : nodes_) {
        if (std::binary_search(node.cores.begin(), node.cores.end(), core)) {
            return node.id;
        }
    }
    return std::nullopt;
}

topology topology::without(const core_set& reserved) const
{
    if (reserved.empty()) return *this;

    std::vector<numa_node> nodes = nodes_;
    for (auto& node : nodes) {
        node.cores.erase(std::remove_if(node.cores.begin(), node.cores.end(),
                                        [&](core_id c) {
                                            return std::find(reserved.begin(), reserved.end(), c) != reserved.end();
                                        }),
                         node.cores.end());
    }
    return topology{std::move(nodes)};
}

std::string topology::to_string() const
{
    std::ostringstream os;
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        if (i) os << ' ';
        os << "node" << nodes_[i].id << "={";
        for (std::size_t j = 0; j < nodes_[i].cores.size(); ++j) {
            if (j) os << ',';
            os << nodes_[i].cores[j];
        }
        os << '}';
    }
    return os.str();
}

bool numa_supported() noexcept
{
#if defined(__linux__)
    return ::numa_available() != -1;
#else
    return false;
#endif
}

topology discover_topology()
{
#if defined(__linux__)
    if (!numa_supported()) {
        throw topology_error(topology_errc::unsupported, "libnuma reports numa is not available");
    }

    cpumask_ptr cpus{::numa_allocate_cpumask()};
    if (!cpus) {
        throw topology_error(topology_errc::unsupported, "numa_allocate_cpumask failed");
    }

    const int max_node = ::numa_max_node();
    const int cpu_count = ::numa_num_configured_cpus();

    std::vector<numa_node> nodes;
    for (int node = 0; node <= max_node; ++node) {
        if (!::numa_bitmask_isbitset(numa_all_nodes_ptr, static_cast<unsigned>(node))) continue;

        ::numa_bitmask_clearall(cpus.get());
        if (::numa_node_to_cpus(node, cpus.get()) != 0) continue;

        numa_node entry;
        entry.id = static_cast<node_id>(node);
        for (int cpu = 0; cpu < cpu_count; ++cpu) {
            const auto bit = static_cast<unsigned>(cpu);
            if (::numa_bitmask_isbitset(cpus.get(), bit) && ::numa_bitmask_isbitset(numa_all_cpus_ptr, bit)) {
                entry.cores.push_back(static_cast<core_id>(cpu));
            }
        }
        if (!entry.cores.empty()) {
            nodes.push_back(std::move(entry));
        }
    }

    if (nodes.empty()) {
        throw topology_error(topology_errc::unsupported, "libnuma reported no node with usable cpus");
    }
    return topology{std::move(nodes)};
#else
    throw topology_error(topology_errc::unsupported, "numa discovery is not supported on this platform");
#endif
}

core_set allowed_cores()
{
#if defined(__linux__)
    cpu_set_t set;
    CPU_ZERO(&set);
    if (::pthread_getaffinity_np(::pthread_self(), sizeof(set), &set) == 0) {
        core_set cores;
        for (unsigned cpu = 0; cpu < CPU_SETSIZE; ++cpu) {
            if (CPU_ISSET(cpu, &set)) cores.push_back(cpu);
        }
        if (!cores.empty()) return cores;
    }
#endif
    return hardware_concurrency_cores();
}

topology single_node_topology(core_set cores)
{
    numa_node node;
    node.id = 0;
    node.cores = make_core_set(std::move(cores));
    std::vector<numa_node> nodes;
    nodes.push_back(std::move(node));
    return topology{std::move(nodes)};
}

topology single_node_topology(std::size_t core_count)
{
    core_set cores(core_count);
    for (std::size_t i = 0; i < core_count; ++i) cores[i] = static_cast<core_id>(i);
    return single_node_topology(std::move(cores));
}

} // namespace shardrt::support
