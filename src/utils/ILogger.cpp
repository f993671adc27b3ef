#include "ILogger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        default: return "UNKNOWN";
    }
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
    if (text == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (text == "INFO") {
        level = LogLevel::INFO;
    } else if (text == "WARN" || text == "WARNING") {
        level = LogLevel::WARNING;
    } else if (text == "ERROR") {
        level = LogLevel::ERROR_LEVEL;
    } else {
        return false;
    }
    return true;
}
