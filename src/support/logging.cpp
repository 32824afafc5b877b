#include <shardrt/support/logging.hpp>

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <shardrt/support/env.hpp>

namespace shardrt::support {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_default_logger()
{
    // A logger the host registered under our name keeps its own level.
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }

    auto log = spdlog::stderr_color_mt(logger_name);
    log->set_level(spdlog::level::info);
    if (auto value = env_string(log_level_env)) {
        auto level = spdlog::level::from_str(*value);
        // from_str maps unknown names to off; only honour off when asked for.
        if (level != spdlog::level::off || *value == "off") {
            log->set_level(level);
        } else {
            log->warn("ignoring unknown {}='{}'", log_level_env, *value);
        }
    }
    return log;
}

} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    std::lock_guard<std::mutex> guard(g_logger_mutex);
    if (!g_logger) {
        g_logger = make_default_logger();
    }
    return g_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement)
{
    std::lock_guard<std::mutex> guard(g_logger_mutex);
    g_logger = std::move(replacement);
}

} // namespace shardrt::support
