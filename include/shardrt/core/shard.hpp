#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <shardrt/core/errors.hpp>
#include <shardrt/core/runtime.hpp>
#include <shardrt/core/shard_plan.hpp>
#include <shardrt/support/affinity.hpp>
#include <shardrt/support/noncopyable.hpp>

namespace shardrt::core {

// planned -> starting -> bound -> running -> finished. starting is entered
// on the shard's own thread. A failed bind or a runtime that cannot be
// built goes straight to finished, as does a thread that cannot be created.
enum class shard_state {
    planned,
    starting,
    bound,
    running,
    finished,
};

[[nodiscard]] const char* to_string(shard_state state) noexcept;

// Type-erased value produced by the init workload. Kept alive until every
// shard of the group has finished.
class init_value {
public:
    init_value() = default;

    template <class T>
    static init_value make(T value)
    {
        init_value v;
        v.ptr_ = std::make_shared<T>(std::move(value));
        v.type_ = std::type_index(typeid(T));
        return v;
    }

    template <class T>
    T* get() const noexcept
    {
        if (!ptr_ || type_ != std::type_index(typeid(T))) return nullptr;
        return static_cast<T*>(ptr_.get());
    }

private:
    std::shared_ptr<void> ptr_;
    std::type_index type_ = std::type_index(typeid(void));
};

// What a shard needs from its group besides its own plan entry.
struct shard_environment {
    std::shared_ptr<support::affinity_binder> binder;
    std::shared_ptr<runtime_factory>          factory;
    std::size_t                               worker_threads = 1;
    std::size_t                               shard_count = 1;
    std::shared_ptr<const init_value>         init;
};

class shard;

// Handed to the entry workload on the shard's own thread.
class shard_context {
public:
    shard_context(const shard& owner, core::runtime& rt, const shard_environment& env) noexcept
        : owner_(owner)
        , runtime_(rt)
        , env_(env)
    {}

    std::size_t shard_index() const noexcept;
    std::size_t shard_count() const noexcept { return env_.shard_count; }
    const plan_entry& placement() const noexcept;

    core::runtime& runtime() noexcept { return runtime_; }

    // Run `fn` on one of this shard's worker threads.
    template <class F>
    auto spawn(F&& fn)
    {
        return runtime_.spawn(std::forward<F>(fn));
    }

    // The init workload's result. Throws std::bad_cast when init returned
    // nothing or a different type.
    template <class T>
    T& init_result() const
    {
        T* value = env_.init ? env_.init->get<T>() : nullptr;
        if (!value) throw std::bad_cast();
        return *value;
    }

private:
    const shard& owner_;
    core::runtime& runtime_;
    const shard_environment& env_;
};

// One independently scheduled execution context: a dedicated thread that
// pins itself to its plan entry, builds the shard runtime (whose workers
// inherit the pinning) and runs the entry workload on itself.
class shard : private support::nonmovable {
public:
    using body_type = std::function<void(shard_context&)>;

    shard(plan_entry entry, shard_environment env);
    ~shard();

    // Launch the shard thread. Never throws: a thread that cannot be
    // created finishes the shard with a startup error.
    void start(body_type body) noexcept;

    // Wait for the shard to reach finished. Idempotent.
    void join() noexcept;

    shard_state state() const noexcept { return state_.load(std::memory_order_acquire); }
    std::size_t index() const noexcept { return entry_.shard_index; }
    const plan_entry& entry() const noexcept { return entry_; }

    // Set once finished, if the shard failed. Only valid after join().
    const std::optional<shard_error>& error() const noexcept { return error_; }

private:
    void run(const body_type& body) noexcept;
    support::bind_status bind() noexcept;
    void transition(shard_state next) noexcept;
    void finish(shard_error error) noexcept;

    plan_entry entry_;
    shard_environment env_;

    std::atomic<shard_state> state_{shard_state::planned};
    std::optional<shard_error> error_;
    std::thread thread_;
};

} // namespace shardrt::core
