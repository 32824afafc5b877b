#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace shardrt::support {

inline constexpr const char* worker_threads_env = "SHARDRT_WORKER_THREADS";

// Value of an environment variable, or nullopt when it is unset or empty.
[[nodiscard]] std::optional<std::string> env_string(const char* name);

// Positive integer from the environment. Unset yields nullopt; anything
// that is not a positive decimal integer throws std::invalid_argument
// naming the variable.
[[nodiscard]] std::optional<std::size_t> env_positive_size(const char* name);

} // namespace shardrt::support
