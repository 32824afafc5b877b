#include <shardrt/core/errors.hpp>

namespace shardrt::core {

const char* to_string(group_errc code) noexcept
{
    switch (code) {
    case group_errc::numa_unavailable:
        return "numa unavailable";
    case group_errc::plan:
        return "shard plan failed";
    case group_errc::init:
        return "init workload failed";
    }
    return "unknown";
}

const char* to_string(shard_errc code) noexcept
{
    switch (code) {
    case shard_errc::affinity:
        return "affinity";
    case shard_errc::workload:
        return "workload";
    case shard_errc::startup:
        return "startup";
    }
    return "unknown";
}

affinity_error::affinity_error(support::bind_status status)
    : std::runtime_error(std::string{"shard placement failed: "} + support::to_string(status))
    , status_(status)
{}

shard_error shard_error::affinity(support::bind_status status) noexcept
{
    return shard_error{shard_errc::affinity, status, nullptr};
}

shard_error shard_error::workload(std::exception_ptr error) noexcept
{
    return shard_error{shard_errc::workload, support::bind_status::ok, std::move(error)};
}

shard_error shard_error::startup(std::exception_ptr error) noexcept
{
    return shard_error{shard_errc::startup, support::bind_status::ok, std::move(error)};
}

std::string shard_error::message() const
{
    if (code_ == shard_errc::affinity) {
        return std::string{"affinity: "} + support::to_string(bind_status_);
    }
    return std::string{to_string(code_)} + ": " + describe(exception_);
}

void shard_error::rethrow() const
{
    if (code_ == shard_errc::affinity) {
        throw affinity_error(bind_status_);
    }
    if (!exception_) {
        throw std::runtime_error(message());
    }
    std::rethrow_exception(exception_);
}

std::string describe(const std::exception_ptr& error)
{
    if (!error) {
        return "no exception";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& ex) {
        return ex.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace shardrt::core
