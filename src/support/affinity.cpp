#include <shardrt/support/affinity.hpp>

#include <cerrno>

#if defined(__linux__)
#include <numa.h>
#include <pthread.h>
#include <sched.h>
#endif

namespace shardrt::support {

namespace {

#if defined(__linux__)
bind_status from_errno(int err, bind_status on_invalid) noexcept
{
    switch (err) {
    case EPERM:
        return bind_status::permission_denied;
    case EINVAL:
        return on_invalid;
    case ENOSYS:
        return bind_status::unsupported;
    default:
        return bind_status::failed;
    }
}
#endif

} // namespace

const char* to_string(bind_status status) noexcept
{
    switch (status) {
    case bind_status::ok:
        return "ok";
    case bind_status::permission_denied:
        return "permission denied";
    case bind_status::invalid_core:
        return "invalid core id";
    case bind_status::invalid_node:
        return "invalid numa node";
    case bind_status::unsupported:
        return "affinity not supported on this platform";
    case bind_status::failed:
        return "affinity syscall failed";
    }
    return "unknown";
}

bind_status os_affinity_binder::bind_to_cores(const core_set& cores) noexcept
{
#if defined(__linux__)
    if (cores.empty()) {
        return bind_status::invalid_core;
    }

    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    for (core_id core : cores) {
        if (core >= CPU_SETSIZE) {
            return bind_status::invalid_core;
        }
        CPU_SET(core, &cpuset);
    }

    // Returns the error number directly rather than through errno.
    int rc = ::pthread_setaffinity_np(::pthread_self(), sizeof(cpu_set_t), &cpuset);
    return rc == 0 ? bind_status::ok : from_errno(rc, bind_status::invalid_core);
#else
    (void)cores;
    return bind_status::unsupported;
#endif
}

bind_status os_affinity_binder::bind_to_numa_node(node_id node) noexcept
{
#if defined(__linux__)
    if (::numa_available() == -1) {
        return bind_status::unsupported;
    }
    if (static_cast<int>(node) > ::numa_max_node()) {
        return bind_status::invalid_node;
    }

    errno = 0;
    if (::numa_run_on_node(static_cast<int>(node)) != 0) {
        return from_errno(errno, bind_status::invalid_node);
    }
    ::numa_set_preferred(static_cast<int>(node));
    return bind_status::ok;
#else
    (void)node;
    return bind_status::unsupported;
#endif
}

std::shared_ptr<affinity_binder> make_os_binder()
{
    return std::make_shared<os_affinity_binder>();
}

} // namespace shardrt::support
