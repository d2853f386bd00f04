#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace ccproxy {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

// Process-wide logger. Writes one line per message to stderr:
//   [2026-01-01 12:00:00.123] [INFO]  message
// The threshold may be changed at any time from any thread.
class Logger {
public:
    static void init(Level threshold);
    static void set_level(Level level);
    static Level level();

    // Cheap pre-check used by the LOG_* macros so disabled levels never format
    static bool is_enabled(Level level) { return level >= threshold_.load(std::memory_order_relaxed); }

    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Parses "debug" / "info" / "warn" / "error" (case-insensitive). Unknown -> INFO.
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace ccproxy

#define LOG_INTERNAL(level, msg)                                                     \
    do {                                                                             \
        if (ccproxy::logging::Logger::is_enabled(level)) {                           \
            std::ostringstream ccproxy_log_ss;                                       \
            ccproxy_log_ss << msg;                                                   \
            ccproxy::logging::Logger::log(level, __FILE__, __LINE__, ccproxy_log_ss.str()); \
        }                                                                            \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(ccproxy::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(ccproxy::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(ccproxy::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(ccproxy::logging::Level::LVL_ERROR, msg)
