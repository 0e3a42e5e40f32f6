#pragma once
// Logging: component-tagged lines on stderr
//
// log_info/log_warn always print. log_debug prints only when the process-wide
// verbose switch is on, prefixed with a millisecond timestamp.
// Callers pass counts, types and ids only. Real values never reach a log line.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

namespace kavach {

namespace detail {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

inline void vlog_line(const char* stamp, const char* component, const char* fmt, va_list args) {
    char msg[1024];
    std::vsnprintf(msg, sizeof(msg), fmt, args);

    std::lock_guard<std::mutex> lock(log_mutex());
    if (stamp) std::cerr << "[" << stamp << "]";
    std::cerr << "[" << component << "] " << msg << "\n";
}

} // namespace detail

inline void set_verbose(bool on) { detail::verbose_flag() = on; }
inline bool verbose() { return detail::verbose_flag(); }

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);
    char stamp[40];
    std::snprintf(stamp, sizeof(stamp), "%s.%03d", time_buf, static_cast<int>(now_ms.count()));

    va_list args;
    va_start(args, fmt);
    detail::vlog_line(stamp, component, fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::vlog_line(nullptr, component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::vlog_line("warn", component, fmt, args);
    va_end(args);
}

} // namespace kavach
