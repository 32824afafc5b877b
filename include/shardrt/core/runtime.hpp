#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <shardrt/support/noncopyable.hpp>

namespace shardrt::core {

struct runtime_options {
    std::string name;                // worker threads are named "<name>/<i>"
    std::size_t worker_threads = 1;  // must be >= 1
};

// Independent executor: a fixed set of worker threads draining one FIFO
// queue. Workers inherit the CPU affinity of the thread that constructs the
// runtime, which is how a shard confines its whole runtime to its cores.
//
// Destruction (or shutdown()) stops accepting work, runs everything already
// queued and joins the workers. Neither may be called from one of the
// runtime's own workers.
class runtime : private support::nonmovable {
public:
    explicit runtime(runtime_options options);
    ~runtime();

    // Queue `fn` and return a future for its result. Exceptions thrown by
    // `fn` are delivered through the future. Throws std::runtime_error once
    // the runtime is shutting down.
    template <class F>
    auto spawn(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using result_type = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(fn));
        auto future = task->get_future();
        enqueue([task] { (*task)(); });
        return future;
    }

    void shutdown() noexcept;

    std::size_t worker_count() const noexcept { return workers_.size(); }
    const std::string& name() const noexcept { return options_.name; }

    // The runtime owning the calling worker thread, or nullptr.
    static runtime* current() noexcept;

private:
    void enqueue(std::function<void()> task);
    void worker_loop(std::size_t index);

    runtime_options options_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;

    std::vector<std::thread> workers_;
};

// Seam between the orchestrator and runtime construction, so callers can
// observe or replace how shard runtimes come to life.
class runtime_factory {
public:
    virtual ~runtime_factory() = default;

    [[nodiscard]] virtual std::unique_ptr<runtime> create(const runtime_options& options) = 0;
};

class default_runtime_factory final : public runtime_factory {
public:
    [[nodiscard]] std::unique_ptr<runtime> create(const runtime_options& options) override
    {
        return std::make_unique<runtime>(options);
    }
};

} // namespace shardrt::core
