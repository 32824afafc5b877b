#include <shardrt/core/runtime.hpp>

#include <algorithm>

#if defined(__linux__)
#include <pthread.h>
#endif

#include <shardrt/support/logging.hpp>

namespace shardrt::core {

namespace {

thread_local runtime* t_current_runtime = nullptr;

void set_current_thread_name(const std::string& name) noexcept
{
#if defined(__linux__)
    // Linux limits thread names to 15 characters plus the terminator.
    char buf[16] = {};
    const std::size_t n = std::min(name.size(), sizeof(buf) - 1);
    name.copy(buf, n);
    ::pthread_setname_np(::pthread_self(), buf);
#else
    (void)name;
#endif
}

} // namespace

runtime::runtime(runtime_options options)
    : options_(std::move(options))
{
    if (options_.worker_threads == 0) {
        throw std::invalid_argument("runtime '" + options_.name + "' needs at least one worker thread");
    }

    workers_.reserve(options_.worker_threads);
    try {
        for (std::size_t i = 0; i < options_.worker_threads; ++i) {
            workers_.emplace_back([this, i] { worker_loop(i); });
        }
    } catch (...) {
        shutdown();
        throw;
    }

    support::logger()->debug("runtime '{}' started with {} worker(s)", options_.name, workers_.size());
}

runtime::~runtime()
{
    shutdown();
}

void runtime::shutdown() noexcept
{
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
}

runtime* runtime::current() noexcept
{
    return t_current_runtime;
}

void runtime::enqueue(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (stopping_) {
            throw std::runtime_error("runtime '" + options_.name + "' is shutting down");
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void runtime::worker_loop(std::size_t index)
{
    t_current_runtime = this;
    set_current_thread_name(options_.name + "/" + std::to_string(index));

    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break; // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        // Queued tasks are packaged_tasks; failures land in their futures.
        task();
    }

    t_current_runtime = nullptr;
}

} // namespace shardrt::core
