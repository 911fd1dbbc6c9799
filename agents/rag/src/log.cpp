#include "../include/log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_log_mtx;

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

LogLevel parse_log_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return (char)std::toupper(c); });
    if (n == "DEBUG") return LogLevel::Debug;
    if (n == "WARNING" || n == "WARN") return LogLevel::Warning;
    if (n == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void log_line(LogLevel level, const std::string& tag, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
    char msbuf[8];
    std::snprintf(msbuf, sizeof(msbuf), ",%03d", static_cast<int>(ms));

    std::lock_guard<std::mutex> lock(g_log_mtx);
    std::cerr << stamp << msbuf << " - " << level_name(level) << " [" << tag << "] " << message << std::endl;
}
