#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace tcplat {
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
    static std::atomic<int> lvl{static_cast<int>(LogLevel::INFO)};
    return lvl;
}

inline void set_log_level(LogLevel lvl) {
    log_threshold().store(static_cast<int>(lvl));
}

inline bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "debug") out = LogLevel::DEBUG;
    else if (s == "info") out = LogLevel::INFO;
    else if (s == "warn") out = LogLevel::WARN;
    else if (s == "error") out = LogLevel::ERROR;
    else return false;
    return true;
}

inline void log(LogLevel lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < log_threshold().load()) return;
    static std::mutex mu;
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    std::lock_guard<std::mutex> lock(mu);
    std::fprintf(stderr, "[%s] %s: %s\n", buf, level_name(lvl), msg.c_str());
}
}  // namespace tcplat
