// =============================================================================
// Mirador - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: MLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <ctime>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <atomic>

namespace mirador::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// Accepts "trace", "debug", "info", "warn", "error", "fatal"; anything else -> Info
inline Level parseLevel(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

inline void setLogLevel(Level l) { g_min_level = l; }

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "w");  // overwrite: one log per process run
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) return;
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif
    char time_str[32];
    snprintf(time_str, sizeof(time_str), "%02d:%02d:%02d.%03d",
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms.count());
    unsigned long tid = static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xFFFFFF);
    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "%s [%s] [%s] (T%06lx) %s\n", time_str, levelStr(level), tag, tid, msg);
    if (g_log_file) {
        fprintf(g_log_file, "%s [%s] [%s] (T%06lx) %s\n",
                time_str, levelStr(level), tag, tid, msg);
        fflush(g_log_file);
    }
}

} // namespace mirador::log

#define MLOG_TRACE(tag, fmt, ...) mirador::log::write(mirador::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define MLOG_DEBUG(tag, fmt, ...) mirador::log::write(mirador::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define MLOG_INFO(tag, fmt, ...)  mirador::log::write(mirador::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define MLOG_WARN(tag, fmt, ...)  mirador::log::write(mirador::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define MLOG_ERROR(tag, fmt, ...) mirador::log::write(mirador::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define MLOG_FATAL(tag, fmt, ...) mirador::log::write(mirador::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
