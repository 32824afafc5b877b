#pragma once

#include <cstddef>

namespace shardrt::support {

// Conservative default cache line size; can be specialized per-platform.
inline constexpr std::size_t cache_line_size = 64;

// Wraps a value written by one thread and read by the joiner so that
// neighbouring slots in a vector never share a cache line.
template <class T>
struct alignas(cache_line_size) padded {
    T value{};
};

} // namespace shardrt::support
