#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <shardrt/core/errors.hpp>

namespace shardrt::core {

// Immutable record of how one shard ended. Void entry workloads report
// std::monostate as their value.
template <class T>
class shard_outcome {
public:
    using value_type = T;

    shard_outcome(std::size_t shard_index, T value)
        : shard_index_(shard_index)
        , result_(std::in_place_index<0>, std::move(value))
    {}

    shard_outcome(std::size_t shard_index, shard_error error)
        : shard_index_(shard_index)
        , result_(std::in_place_index<1>, std::move(error))
    {}

    std::size_t shard_index() const noexcept { return shard_index_; }

    bool ok() const noexcept { return result_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    // The entry workload's result; rethrows the shard's failure otherwise.
    const T& value() const&
    {
        if (!ok()) std::get<1>(result_).rethrow();
        return std::get<0>(result_);
    }

    T&& value() &&
    {
        if (!ok()) std::get<1>(result_).rethrow();
        return std::get<0>(std::move(result_));
    }

    const shard_error& error() const
    {
        if (ok()) {
            throw std::logic_error("shard " + std::to_string(shard_index_) + " succeeded; it has no error");
        }
        return std::get<1>(result_);
    }

private:
    std::size_t shard_index_;
    std::variant<T, shard_error> result_;
};

} // namespace shardrt::core
