#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace fastbu {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Process-wide leveled logger writing to stderr
class Logger {
public:
    static void set_level(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    static LogLevel level() { return level_.load(std::memory_order_relaxed); }
    static bool enabled(LogLevel level) { return level >= Logger::level(); }

    // Accepts "debug", "info", "warn"/"warning", "error"
    static bool parse_level(std::string_view name, LogLevel& out);
    static const char* level_name(LogLevel level);

    static void write(LogLevel level, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);

        char stamp[32];
        std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d.%03d",
                      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));

        std::lock_guard lock(mutex_);
        std::cerr << "[" << stamp << "] [fastbu] [" << level_name(level) << "] "
                  << msg << "\n";
    }

private:
    static inline std::atomic<LogLevel> level_{LogLevel::Info};
    static inline std::mutex mutex_;
};

inline bool Logger::parse_level(std::string_view name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info") { out = LogLevel::Info; return true; }
    if (name == "warn" || name == "warning") { out = LogLevel::Warn; return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    return false;
}

inline const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

}  // namespace fastbu

#define FASTBU_LOG(lvl, expr)                                   \
    do {                                                        \
        if (::fastbu::Logger::enabled(lvl)) {                   \
            std::ostringstream _fastbu_log_oss;                 \
            _fastbu_log_oss << expr;                            \
            ::fastbu::Logger::write(lvl, _fastbu_log_oss.str());\
        }                                                       \
    } while (0)

#define FASTBU_LOG_DEBUG(expr) FASTBU_LOG(::fastbu::LogLevel::Debug, expr)
#define FASTBU_LOG_INFO(expr)  FASTBU_LOG(::fastbu::LogLevel::Info, expr)
#define FASTBU_LOG_WARN(expr)  FASTBU_LOG(::fastbu::LogLevel::Warn, expr)
#define FASTBU_LOG_ERROR(expr) FASTBU_LOG(::fastbu::LogLevel::Error, expr)
