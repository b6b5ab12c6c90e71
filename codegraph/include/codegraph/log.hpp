#pragma once
// Logging: component-tagged lines on stderr
//
//   [12:04:31.207][sync] indexed 14 files (3 skipped)
//
// Debug lines are dropped unless verbose mode is on.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace codegraph {
namespace logging {

enum class Level { Debug, Info, Warn, Error };

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline void set_verbose(bool on) { verbose_flag() = on; }
inline bool verbose() { return verbose_flag(); }

inline const char* level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "";
        case Level::Info: return "";
        case Level::Warn: return "warning: ";
        case Level::Error: return "error: ";
    }
    return "";
}

inline void vwrite(Level level, const char* component, const char* fmt, va_list args) {
    if (level == Level::Debug && !verbose()) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::tm tm_buf;
    localtime_r(&now_time_t, &tm_buf);
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    std::fprintf(stderr, "[%s.%03d][%s] %s", time_buf,
                 static_cast<int>(now_ms.count()), component, level_tag(level));
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

} // namespace logging

inline void log_debug(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logging::vwrite(logging::Level::Debug, component, fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logging::vwrite(logging::Level::Info, component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logging::vwrite(logging::Level::Warn, component, fmt, args);
    va_end(args);
}

inline void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logging::vwrite(logging::Level::Error, component, fmt, args);
    va_end(args);
}

} // namespace codegraph
