#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace toolproxy {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

// Logger writes timestamped lines to stderr. Stdout belongs to the program output
// (and, for child servers, to the wire protocol), so nothing is ever logged there.
class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level) { return level >= threshold_.load(std::memory_order_relaxed); }

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Helpers for config parsing ("debug", "info", "warn", "error"; case-insensitive)
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);
bool is_valid_level(const std::string &level_str);

}  // namespace logging
}  // namespace toolproxy

// Stream-style macros: LOG_INFO("[Tag] value=" << value)
#define LOG_INTERNAL(level, msg)                                                  \
    do {                                                                          \
        if (toolproxy::logging::Logger::enabled(level)) {                         \
            std::stringstream ss;                                                 \
            ss << msg;                                                            \
            toolproxy::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
        }                                                                         \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(toolproxy::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(toolproxy::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(toolproxy::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(toolproxy::logging::Level::LVL_ERROR, msg)
