#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace shardrt::support {

inline constexpr const char* logger_name = "shardrt";
inline constexpr const char* log_level_env = "SHARDRT_LOG_LEVEL";

// Shared library logger. On first use, a logger already registered with
// spdlog as "shardrt" is adopted untouched; otherwise a stderr colour logger
// is created and levelled from SHARDRT_LOG_LEVEL (default info).
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Replace the library logger, e.g. to route output into the host
// application's sinks. Passing nullptr restores the default on next use.
void set_logger(std::shared_ptr<spdlog::logger> replacement);

} // namespace shardrt::support
