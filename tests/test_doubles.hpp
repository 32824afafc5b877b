#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include <shardrt/core/runtime.hpp>
#include <shardrt/support/affinity.hpp>

namespace shardrt::testing {

// Records every bind request; refuses any core set containing a core from
// `failing_cores` and any node listed in `failing_nodes`.
class spy_binder final : public support::affinity_binder {
public:
    spy_binder() = default;

    spy_binder(support::core_set failing_cores,
               support::bind_status failure = support::bind_status::permission_denied)
        : failing_cores_(std::move(failing_cores))
        , failure_(failure)
    {}

    void fail_node(support::node_id node) { failing_nodes_.push_back(node); }

    support::bind_status bind_to_cores(const support::core_set& cores) noexcept override
    {
        std::lock_guard<std::mutex> guard(mutex_);
        core_calls_.push_back(cores);
        for (auto core : cores) {
            if (std::find(failing_cores_.begin(), failing_cores_.end(), core) != failing_cores_.end()) {
                return failure_;
            }
        }
        return support::bind_status::ok;
    }

    support::bind_status bind_to_numa_node(support::node_id node) noexcept override
    {
        std::lock_guard<std::mutex> guard(mutex_);
        node_calls_.push_back(node);
        if (std::find(failing_nodes_.begin(), failing_nodes_.end(), node) != failing_nodes_.end()) {
            return support::bind_status::invalid_node;
        }
        return support::bind_status::ok;
    }

    std::vector<support::core_set> core_calls() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto calls = core_calls_;
        std::sort(calls.begin(), calls.end());
        return calls;
    }

    std::vector<support::node_id> node_calls() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto calls = node_calls_;
        std::sort(calls.begin(), calls.end());
        return calls;
    }

    std::size_t total_calls() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return core_calls_.size() + node_calls_.size();
    }

private:
    support::core_set failing_cores_;
    std::vector<support::node_id> failing_nodes_;
    support::bind_status failure_ = support::bind_status::permission_denied;

    mutable std::mutex mutex_;
    std::vector<support::core_set> core_calls_;
    std::vector<support::node_id> node_calls_;
};

// Counts shard runtimes as they are created; optionally refuses to build
// them to simulate thread exhaustion.
class counting_runtime_factory final : public core::runtime_factory {
public:
    explicit counting_runtime_factory(bool fail = false)
        : fail_(fail)
    {}

    std::unique_ptr<core::runtime> create(const core::runtime_options& options) override
    {
        created_.fetch_add(1, std::memory_order_relaxed);
        if (fail_) {
            throw std::runtime_error("no threads left for " + options.name);
        }
        return std::make_unique<core::runtime>(options);
    }

    std::size_t created() const noexcept { return created_.load(std::memory_order_relaxed); }

private:
    bool fail_;
    std::atomic<std::size_t> created_{0};
};

} // namespace shardrt::testing
