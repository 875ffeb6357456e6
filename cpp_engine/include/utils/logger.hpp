/**
 * Lightweight logger used across the engine. Writes timestamped lines to stderr.
 */
#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace tollgate::utils {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

inline LogLevel &min_level() {
    static LogLevel level = LogLevel::Info;
    return level;
}

inline void set_min_level(LogLevel level) { min_level() = level; }

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "LOG";
    }
}

inline bool parse_level(const std::string &name, LogLevel &out) {
    if (name == "debug") {
        out = LogLevel::Debug;
    } else if (name == "info") {
        out = LogLevel::Info;
    } else if (name == "warn") {
        out = LogLevel::Warn;
    } else if (name == "error") {
        out = LogLevel::Error;
    } else if (name == "off") {
        out = LogLevel::Off;
    } else {
        return false;
    }
    return true;
}

inline void log(LogLevel level, const std::string &message) {
    if (static_cast<int>(level) < static_cast<int>(min_level())) {
        return;
    }
    using clock = std::chrono::system_clock;
    const auto now = clock::to_time_t(clock::now());
    std::tm tm_buf{};
#if defined(_MSC_VER)
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%F %T");
    std::cerr << "[" << ss.str() << "][" << level_to_string(level) << "] " << message << std::endl;
}

inline void debug(const std::string &msg) { log(LogLevel::Debug, msg); }
inline void info(const std::string &msg) { log(LogLevel::Info, msg); }
inline void warn(const std::string &msg) { log(LogLevel::Warn, msg); }
inline void error(const std::string &msg) { log(LogLevel::Error, msg); }

}  // namespace tollgate::utils
