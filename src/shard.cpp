#include <shardrt/core/shard.hpp>

#include <stdexcept>
#include <string>

#include <fmt/ranges.h>

#include <shardrt/support/logging.hpp>

namespace shardrt::core {

const char* to_string(shard_state state) noexcept
{
    switch (state) {
    case shard_state::planned:
        return "planned";
    case shard_state::starting:
        return "starting";
    case shard_state::bound:
        return "bound";
    case shard_state::running:
        return "running";
    case shard_state::finished:
        return "finished";
    }
    return "unknown";
}

std::size_t shard_context::shard_index() const noexcept
{
    return owner_.index();
}

const plan_entry& shard_context::placement() const noexcept
{
    return owner_.entry();
}

shard::shard(plan_entry entry, shard_environment env)
    : entry_(std::move(entry))
    , env_(std::move(env))
{}

shard::~shard()
{
    join();
}

void shard::start(body_type body) noexcept
{
    if (state() != shard_state::planned || thread_.joinable()) return;

    try {
        thread_ = std::thread([this, body = std::move(body)] { run(body); });
    } catch (const std::exception&) {
        support::logger()->error("shard {}: cannot create thread: {}", index(), describe(std::current_exception()));
        finish(shard_error::startup(std::current_exception()));
    }
}

void shard::join() noexcept
{
    if (thread_.joinable()) {
        thread_.join();
    }
}

void shard::transition(shard_state next) noexcept
{
    state_.store(next, std::memory_order_release);
    support::logger()->debug("shard {}: {}", index(), to_string(next));
}

void shard::finish(shard_error error) noexcept
{
    error_ = std::move(error);
    transition(shard_state::finished);
}

support::bind_status shard::bind() noexcept
{
    if (entry_.unbound()) {
        return support::bind_status::ok;
    }
    if (!env_.binder) {
        return support::bind_status::unsupported;
    }

    if (entry_.numa_node) {
        auto status = env_.binder->bind_to_numa_node(*entry_.numa_node);
        if (status != support::bind_status::ok) return status;
    }
    if (!entry_.bound_cores.empty()) {
        return env_.binder->bind_to_cores(entry_.bound_cores);
    }
    return support::bind_status::ok;
}

void shard::run(const body_type& body) noexcept
{
    auto log = support::logger();
    transition(shard_state::starting);

    const auto status = bind();
    if (status != support::bind_status::ok) {
        log->warn("shard {}: cannot bind to cores [{}]: {}",
                  index(), fmt::join(entry_.bound_cores, ","), support::to_string(status));
        finish(shard_error::affinity(status));
        return;
    }
    transition(shard_state::bound);

    // Built on this thread after binding so the workers inherit the mask.
    std::unique_ptr<core::runtime> rt;
    try {
        runtime_options options;
        options.name = "shard-" + std::to_string(index());
        options.worker_threads = env_.worker_threads;
        rt = env_.factory->create(options);
        if (!rt) throw std::runtime_error("runtime factory returned no runtime");
    } catch (...) {
        log->error("shard {}: cannot start runtime: {}", index(), describe(std::current_exception()));
        finish(shard_error::startup(std::current_exception()));
        return;
    }

    std::optional<shard_error> failure;
    {
        shard_context ctx{*this, *rt, env_};
        transition(shard_state::running);
        try {
            body(ctx);
        } catch (...) {
            failure = shard_error::workload(std::current_exception());
            log->error("shard {}: entry workload failed: {}", index(), failure->message());
        }
    }

    // Drain whatever the entry left queued before reporting completion.
    rt->shutdown();
    rt.reset();

    if (failure) {
        finish(std::move(*failure));
    } else {
        transition(shard_state::finished);
    }
}

} // namespace shardrt::core
