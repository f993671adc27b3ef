// src/utils/ConsoleLogger.cpp
#include "ConsoleLogger.hpp"
#include <iostream>

ConsoleLogger::ConsoleLogger(LogLevel level) : level(level) {}

void ConsoleLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void ConsoleLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void ConsoleLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void ConsoleLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void ConsoleLogger::setLogLevel(LogLevel newLevel) {
    level = newLevel;
}

LogLevel ConsoleLogger::getLogLevel() const {
    return level;
}

void ConsoleLogger::log(LogLevel messageLevel, const std::string& message) {
    if (messageLevel < level.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(outputMutex);
    // 错误输出到stderr，其余输出到stdout
    std::ostream& out = messageLevel == LogLevel::ERROR_LEVEL ? std::cerr : std::cout;
    out << "[" << currentTimestamp() << "] [" << logLevelName(messageLevel) << "] " << message << std::endl;
}
