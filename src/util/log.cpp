#include "coinjecture/log.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace coinjecture::log {

static std::atomic<LogLevel> g_log_level{LogLevel::WARN};
static std::mutex g_sink_mutex;
static LogSink g_sink;

static void write_stderr(LogLevel level, const std::string& message) {
    using namespace std::chrono;
    const std::time_t tt = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::fprintf(stderr, "[%04d-%02d-%02d %02d:%02d:%02d][%s] %s\n",
                 tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                 tm.tm_hour, tm.tm_min, tm.tm_sec,
                 level_name(level), message.c_str());
}

void set_level(LogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

LogLevel get_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

void set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

bool parse_level(const std::string& name, LogLevel& out) {
    static const struct {
        const char* name;
        LogLevel level;
    } names[] = {
        {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
        {"error", LogLevel::ERR},   {"none", LogLevel::NONE},
    };
    for (const auto& entry : names) {
        if (name == entry.name) {
            out = entry.level;
            return true;
        }
    }
    return false;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::NONE:  return "NONE";
    }
    return "UNKNOWN";
}

void write(LogLevel level, const std::string& message) {
    // Run the sink unlocked so it may log or replace itself
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        sink = g_sink;
    }
    if (sink) {
        sink(level, message);
    } else {
        write_stderr(level, message);
    }
}

} // namespace coinjecture::log
