// =============================================================================
// Tether - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with two sinks: stderr and an optional
// log file. Each sink has its own threshold so the CLI can keep the console
// quiet while the file records everything.
// Usage: TLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string>
#include <atomic>

#include <unistd.h>
#include <sys/syscall.h>

namespace tether::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal, Off };

inline std::atomic<Level> g_console_level{Level::Info};
inline std::atomic<Level> g_file_level{Level::Info};
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
        case Level::Off:   break;
    }
    return "?????";
}

inline void setConsoleLevel(Level l) { g_console_level = l; }
inline void setFileLevel(Level l) { g_file_level = l; }

// Accepts "trace".."fatal" and "off" (case-insensitive). Unknown names yield fallback.
inline Level parseLogLevel(const std::string& name, Level fallback = Level::Info) {
    std::string s;
    for (char c : name) s += static_cast<char>((c >= 'A' && c <= 'Z') ? c + 32 : c);
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "info")  return Level::Info;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal") return Level::Fatal;
    if (s == "off" || s == "none") return Level::Off;
    return fallback;
}

inline unsigned long currentThreadId() {
    return static_cast<unsigned long>(::syscall(SYS_gettid));
}

// One file per run; the first line records the pid so logs of a supervisor
// and the children it spawned can be told apart.
inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "w");
    if (!g_log_file) return false;
    fprintf(g_log_file, "--- tether pid %d ---\n", (int)::getpid());
    fflush(g_log_file);
    return true;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    bool to_console = level >= g_console_level.load(std::memory_order_relaxed);
    bool to_file = level >= g_file_level.load(std::memory_order_relaxed);
    if (!to_console && !to_file) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    char line[2304];
    int n = snprintf(line, sizeof(line), "%02d:%02d:%02d.%03d [%s] [%s] (T%lu) ",
                     tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms.count(),
                     levelStr(level), tag, currentThreadId());
    if (n < 0) return;
    size_t used = static_cast<size_t>(n) < sizeof(line) ? static_cast<size_t>(n) : sizeof(line) - 1;
    va_list args;
    va_start(args, fmt);
    vsnprintf(line + used, sizeof(line) - used, fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (to_console) fprintf(stderr, "%s\n", line);
    if (to_file && g_log_file) {
        fprintf(g_log_file, "%s\n", line);
        fflush(g_log_file);
    }
}

} // namespace tether::log

#define TLOG_TRACE(tag, fmt, ...) tether::log::write(tether::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define TLOG_DEBUG(tag, fmt, ...) tether::log::write(tether::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define TLOG_INFO(tag, fmt, ...)  tether::log::write(tether::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define TLOG_WARN(tag, fmt, ...)  tether::log::write(tether::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define TLOG_ERROR(tag, fmt, ...) tether::log::write(tether::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define TLOG_FATAL(tag, fmt, ...) tether::log::write(tether::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
