#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include <shardrt/support/affinity.hpp>

namespace shardrt::core {

// Failures that stop a group before any shard starts. The underlying cause
// (topology_error, plan_error, the init workload's exception) is attached
// with std::throw_with_nested; use std::rethrow_if_nested to reach it.
enum class group_errc {
    numa_unavailable,
    plan,
    init,
};

[[nodiscard]] const char* to_string(group_errc code) noexcept;

class group_error : public std::runtime_error {
public:
    group_error(group_errc code, const std::string& what)
        : std::runtime_error(what)
        , code_(code)
    {}

    group_errc code() const noexcept { return code_; }

private:
    group_errc code_;
};

// Thrown by shard_outcome::value() for a shard that could not be placed.
class affinity_error : public std::runtime_error {
public:
    explicit affinity_error(support::bind_status status);

    support::bind_status status() const noexcept { return status_; }

private:
    support::bind_status status_;
};

enum class shard_errc {
    affinity, // the binder refused the shard's placement; entry never ran
    workload, // the entry workload threw
    startup,  // the shard's thread or runtime could not be created
};

// Per-shard failure. Never escapes run(); it is carried in the outcome.
class shard_error {
public:
    [[nodiscard]] static shard_error affinity(support::bind_status status) noexcept;
    [[nodiscard]] static shard_error workload(std::exception_ptr error) noexcept;
    [[nodiscard]] static shard_error startup(std::exception_ptr error) noexcept;

    shard_errc code() const noexcept { return code_; }

    // bind_status::ok unless code() == shard_errc::affinity.
    support::bind_status bind_status() const noexcept { return bind_status_; }

    // The captured exception for workload and startup failures.
    std::exception_ptr exception() const noexcept { return exception_; }

    std::string message() const;

    // Workload/startup: rethrow the captured exception. Affinity: throw
    // affinity_error.
    [[noreturn]] void rethrow() const;

private:
    shard_error(shard_errc code, support::bind_status status, std::exception_ptr error) noexcept
        : code_(code)
        , bind_status_(status)
        , exception_(std::move(error))
    {}

    shard_errc code_;
    support::bind_status bind_status_;
    std::exception_ptr exception_;
};

[[nodiscard]] const char* to_string(shard_errc code) noexcept;

// Best-effort description of an exception_ptr for logs.
std::string describe(const std::exception_ptr& error);

} // namespace shardrt::core
