#include "CompositeLogger.hpp"

CompositeLogger::CompositeLogger(std::vector<ILogger*> loggers) : loggers(std::move(loggers)) {}

void CompositeLogger::addLogger(ILogger* logger) {
    if (logger) {
        loggers.push_back(logger);
    }
}

void CompositeLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void CompositeLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void CompositeLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void CompositeLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

// 只调整自身门限，子记录器保留各自的级别
void CompositeLogger::setLogLevel(LogLevel newLevel) {
    level = newLevel;
}

LogLevel CompositeLogger::getLogLevel() const {
    return level;
}

void CompositeLogger::log(LogLevel messageLevel, const std::string& message) {
    if (messageLevel < level) {
        return;
    }
    for (ILogger* logger : loggers) {
        logger->log(messageLevel, message);
    }
}
