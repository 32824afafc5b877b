#pragma once

#include <memory>

#include <shardrt/support/cpu_topology.hpp>

namespace shardrt::support {

enum class bind_status {
    ok = 0,
    permission_denied,
    invalid_core,
    invalid_node,
    unsupported,
    failed,
};

[[nodiscard]] const char* to_string(bind_status status) noexcept;

// Pins the *calling* thread. Implementations must be callable concurrently
// from many shard threads; each call only affects the thread making it.
class affinity_binder {
public:
    virtual ~affinity_binder() = default;

    [[nodiscard]] virtual bind_status bind_to_cores(const core_set& cores) noexcept = 0;

    // Run the calling thread on the cpus of `node` and prefer allocating
    // memory there.
    [[nodiscard]] virtual bind_status bind_to_numa_node(node_id node) noexcept = 0;
};

// pthread_setaffinity_np for core sets, libnuma for node binding. On
// platforms without either every call returns bind_status::unsupported.
class os_affinity_binder final : public affinity_binder {
public:
    [[nodiscard]] bind_status bind_to_cores(const core_set& cores) noexcept override;
    [[nodiscard]] bind_status bind_to_numa_node(node_id node) noexcept override;
};

[[nodiscard]] std::shared_ptr<affinity_binder> make_os_binder();

} // namespace shardrt::support
