#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace cscan {
enum class LogLevel { DEBUG, INFO, WARN, ERROR };

inline const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

inline std::atomic<int>& log_threshold() {
    static std::atomic<int> threshold{static_cast<int>(LogLevel::INFO)};
    return threshold;
}

inline void set_log_level(LogLevel lvl) {
    log_threshold().store(static_cast<int>(lvl));
}

inline void log(LogLevel lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < log_threshold().load()) return;
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm_utc);
    std::fprintf(stderr, "[%s] %s: %s\n", buf, level_name(lvl), msg.c_str());
}
}  // namespace cscan
