#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <shardrt/core/errors.hpp>
#include <shardrt/core/outcome.hpp>
#include <shardrt/core/runtime.hpp>
#include <shardrt/core/shard.hpp>
#include <shardrt/core/shard_plan.hpp>
#include <shardrt/support/affinity.hpp>
#include <shardrt/support/cache_line.hpp>
#include <shardrt/support/clock.hpp>
#include <shardrt/support/cpu_topology.hpp>
#include <shardrt/support/noncopyable.hpp>

namespace shardrt::core {

// Immutable configuration snapshot taken by runtime_group.
struct group_config {
    affinity_mode                             mode = affinity_mode::core_only;
    std::size_t                               workers_per_numa = 1;
    std::optional<std::size_t>                shard_count;    // core_only / none override
    std::optional<std::size_t>                worker_threads; // per shard runtime
    core_set                                  reserved_cores;
    std::optional<support::topology>          topology;       // discovered when unset
    std::function<support::topology()>        discover;       // support::discover_topology when unset
    std::shared_ptr<support::affinity_binder> binder;         // os binder when unset
    std::shared_ptr<core::runtime_factory>    runtime_factory;
    std::function<init_value(runtime&)>       init;           // optional

    bool numa_enabled() const noexcept { return mode == affinity_mode::numa_aware; }
};

// Worker threads given to the init runtime.
inline constexpr std::size_t init_worker_threads = 2;

// Non-template half of the orchestrator.
//
//   prepare(): topology -> plan -> init. Throws group_error; no shard exists
//              yet when it does.
//   launch():  one shard per plan entry, full join, per-shard reports in
//              shard_index order. Never throws group_error.
class group_driver : private support::nonmovable {
public:
    struct report {
        plan_entry                 placement;
        std::optional<shard_error> error;
    };

    explicit group_driver(group_config config);
    ~group_driver();

    [[nodiscard]] const std::vector<plan_entry>& prepare();

    [[nodiscard]] std::vector<report> launch(const shard::body_type& body);

private:
    support::topology resolve_topology() const;
    std::size_t worker_threads_for(const plan_entry& entry) const;
    void run_init();

    group_config config_;
    std::optional<std::size_t> env_worker_threads_;
    support::topology topology_;
    std::vector<plan_entry> plan_;
    bool prepared_ = false;

    std::unique_ptr<runtime> init_runtime_;
    std::shared_ptr<const init_value> init_value_;
};

// A configured group whose entry workload returns R. Built by
// group_builder::entry().
template <class R>
class runtime_group {
public:
    using value_type = std::conditional_t<std::is_void_v<R>, std::monostate, R>;
    using outcome_type = shard_outcome<value_type>;
    using entry_type = std::function<R(shard_context&)>;

    runtime_group(group_config config, entry_type entry)
        : config_(std::move(config))
        , entry_(std::move(entry))
    {}

    const group_config& config() const noexcept { return config_; }

    // Blocks until every shard has finished. Outcomes are ordered by
    // shard_index. Throws group_error when the group never started.
    [[nodiscard]] std::vector<outcome_type> run() const
    {
        group_driver driver{config_};
        const auto& plan = driver.prepare();

        std::vector<support::padded<std::optional<value_type>>> slots(plan.size());
        auto reports = driver.launch([this, &slots](shard_context& ctx) {
            auto& slot = slots[ctx.shard_index()].value;
            if constexpr (std::is_void_v<R>) {
                entry_(ctx);
                slot.emplace();
            } else {
                slot.emplace(entry_(ctx));
            }
        });

        std::vector<outcome_type> outcomes;
        outcomes.reserve(reports.size());
        for (auto& r : reports) {
            const std::size_t index = r.placement.shard_index;
            if (r.error) {
                outcomes.emplace_back(index, std::move(*r.error));
            } else {
                outcomes.emplace_back(index, std::move(*slots[index].value));
            }
        }
        return outcomes;
    }

private:
    group_config config_;
    entry_type entry_;
};

namespace detail {

template <class F, class Arg>
decltype(auto) invoke_maybe_with(F& fn, Arg& arg)
{
    if constexpr (std::is_invocable_v<F&, Arg&>) {
        return fn(arg);
    } else {
        static_assert(std::is_invocable_v<F&>,
                      "workload must be callable with no arguments or with the context it is given");
        return fn();
    }
}

template <class F, class Arg>
using maybe_with_result_t = decltype(invoke_maybe_with(std::declval<F&>(), std::declval<Arg&>()));

} // namespace detail

// Fluent configuration for a runtime_group:
//
//   auto outcomes = shardrt::core::group_builder{}
//                       .numa(true)
//                       .workers_per_numa(2)
//                       .init([] { return load_tables(); })
//                       .entry([](shardrt::core::shard_context& ctx) { return serve(ctx); })
//                       .run();
//
// The entry workload is invoked concurrently on every shard and must be
// safe to call that way.
class group_builder {
public:
    group_builder() = default;

    // NUMA-aware planning when true, core-only otherwise.
    group_builder& numa(bool enable) noexcept;

    // Shards per NUMA node. Throws std::invalid_argument for 0.
    group_builder& workers_per_numa(std::size_t n);

    group_builder& affinity(affinity_mode mode) noexcept;

    // Shard count for core_only / none planning. Throws std::invalid_argument for 0.
    group_builder& shards(std::size_t n);

    // Worker threads per shard runtime. Throws std::invalid_argument for 0.
    group_builder& worker_threads(std::size_t n);

    // Cores excluded from planning (e.g. left to interrupt handling).
    group_builder& reserve_cores(core_set cores);

    group_builder& topology(support::topology topo);

    // NUMA discovery used when no topology was given. Defaults to
    // support::discover_topology(); a support::topology_error it throws
    // fails the group with group_errc::numa_unavailable.
    group_builder& discover(std::function<support::topology()> fn);
    group_builder& binder(std::shared_ptr<support::affinity_binder> binder);
    group_builder& runtime_factory(std::shared_ptr<core::runtime_factory> factory);

    // Run once before any shard, on an unbound runtime. `fn` may take the
    // init runtime; a non-void result stays alive for the whole run and is
    // readable through shard_context::init_result<T>().
    template <class F>
    group_builder& init(F fn)
    {
        config_.init = [fn = std::move(fn)](runtime& rt) mutable -> init_value {
            using result = detail::maybe_with_result_t<F, runtime>;
            if constexpr (std::is_void_v<result>) {
                detail::invoke_maybe_with(fn, rt);
                return init_value{};
            } else {
                return init_value::make<std::decay_t<result>>(detail::invoke_maybe_with(fn, rt));
            }
        };
        return *this;
    }

    template <class F>
    auto entry(F fn) const
    {
        using result = std::decay_t<detail::maybe_with_result_t<const F, shard_context>>;
        typename runtime_group<result>::entry_type erased =
            [fn = std::move(fn)](shard_context& ctx) -> result {
            return detail::invoke_maybe_with(fn, ctx);
        };
        return runtime_group<result>{config_, std::move(erased)};
    }

    const group_config& config() const noexcept { return config_; }

private:
    group_config config_;
};

} // namespace shardrt::core
