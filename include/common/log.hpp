/*
 * File: include/common/log.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Process-wide line logger on stderr
 * Notes:
 *  - <timestamp> LEVEL [component] message
 *  - Threshold set once from config; lines never interleave
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

enum class LogLevel
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

// RFC3339 UTC with milliseconds (e.g., 2026-10-19T14:59:01.234Z)
inline std::string iso8601_now_ms()
{
    using namespace std::chrono;
    auto now = time_point_cast<milliseconds>(system_clock::now());
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

inline std::int64_t now_epoch_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

inline std::atomic<int> &log_threshold()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::info)};
    return level;
}

inline void set_log_level(LogLevel level) { log_threshold() = static_cast<int>(level); }

inline LogLevel parse_log_level(const std::string &s)
{
    if (s == "debug")
        return LogLevel::debug;
    if (s == "info")
        return LogLevel::info;
    if (s == "warn" || s == "warning")
        return LogLevel::warn;
    if (s == "error")
        return LogLevel::error;
    throw std::invalid_argument("unknown log level: " + s);
}

inline const char *log_level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::debug:
        return "DEBUG";
    case LogLevel::info:
        return "INFO";
    case LogLevel::warn:
        return "WARN";
    case LogLevel::error:
        return "ERROR";
    }
    return "?";
}

inline void log_line(LogLevel level, const char *component, const std::string &msg)
{
    if (static_cast<int>(level) < log_threshold().load())
        return;
    static std::mutex mtx;
    const std::string ts = iso8601_now_ms();
    std::scoped_lock lk(mtx);
    std::cerr << ts << ' ' << log_level_name(level) << " [" << component << "] " << msg << "\n";
}

inline void log_debug(const char *component, const std::string &msg) { log_line(LogLevel::debug, component, msg); }
inline void log_info(const char *component, const std::string &msg) { log_line(LogLevel::info, component, msg); }
inline void log_warn(const char *component, const std::string &msg) { log_line(LogLevel::warn, component, msg); }
inline void log_error(const char *component, const std::string &msg) { log_line(LogLevel::error, component, msg); }
