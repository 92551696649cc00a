#pragma once

#include <memory>
#include <mutex>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace syncmap::log {

/// Name under which the library logger is registered with spdlog
inline constexpr const char* logger_name = "syncmap";

namespace detail {

struct LoggerSlot {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
};

inline LoggerSlot& slot() {
    static LoggerSlot instance;
    return instance;
}

} // namespace detail

/**
 * Library logger.
 *
 * Reuses a logger already registered under "syncmap" (so applications can
 * configure sinks and levels up front), otherwise creates a stderr colour
 * logger on first use. Library messages are debug/trace only, so nothing
 * is printed at spdlog's default info level.
 */
inline std::shared_ptr<spdlog::logger> logger() {
    auto& s = detail::slot();
    std::scoped_lock lock(s.mutex);
    if (!s.logger) {
        s.logger = spdlog::get(logger_name);
        if (!s.logger) {
            s.logger = spdlog::stderr_color_mt(logger_name);
        }
    }
    return s.logger;
}

/**
 * Replace the library logger (e.g. with a null or test sink).
 */
inline void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    auto& s = detail::slot();
    std::scoped_lock lock(s.mutex);
    s.logger = std::move(replacement);
}

inline void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }

} // namespace syncmap::log
