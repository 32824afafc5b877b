#pragma once

#include <chrono>

namespace shardrt::support {

using clock = std::chrono::steady_clock;
using time_point = clock::time_point;

// Milliseconds elapsed since `start`, as a double for log output.
inline double elapsed_ms(time_point start) noexcept
{
    return std::chrono::duration<double, std::milli>(clock::now() - start).count();
}

} // namespace shardrt::support
