#pragma once

#include <functional>
#include <string>

namespace coinjecture::log {

// ERR rather than ERROR to stay clear of the Windows macro
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    NONE = 5
};

/// Receives every emitted line. Must be safe to call from any thread and
/// must not throw; it is invoked from inside the C ABI's error handlers.
using LogSink = std::function<void(LogLevel, const std::string&)>;

void set_level(LogLevel level);
LogLevel get_level();

/// Replace the output sink; an empty function restores the stderr sink
void set_sink(LogSink sink);

/// Parse "trace", "debug", "info", "warn", "error" or "none"
bool parse_level(const std::string& name, LogLevel& out);
const char* level_name(LogLevel level);

void write(LogLevel level, const std::string& message);

inline bool enabled(LogLevel level) {
    return level != LogLevel::NONE && get_level() <= level;
}

} // namespace coinjecture::log

// Skip message construction when the level is disabled
#define COINJ_LOG(level, msg) do { \
    if (coinjecture::log::enabled(level)) { \
        coinjecture::log::write(level, msg); \
    } \
} while (0)

#define COINJ_LOG_TRACE(msg) COINJ_LOG(coinjecture::log::LogLevel::TRACE, msg)
#define COINJ_LOG_DEBUG(msg) COINJ_LOG(coinjecture::log::LogLevel::DEBUG, msg)
#define COINJ_LOG_INFO(msg)  COINJ_LOG(coinjecture::log::LogLevel::INFO, msg)
#define COINJ_LOG_WARN(msg)  COINJ_LOG(coinjecture::log::LogLevel::WARN, msg)
#define COINJ_LOG_ERROR(msg) COINJ_LOG(coinjecture::log::LogLevel::ERR, msg)
