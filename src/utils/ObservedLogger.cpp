#include "ObservedLogger.hpp"

ObservedLogger::ObservedLogger(ILogger* inner, Sink sink) : inner(inner), sink(std::move(sink)) {}

void ObservedLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void ObservedLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void ObservedLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void ObservedLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void ObservedLogger::setLogLevel(LogLevel level) {
    if (inner) {
        inner->setLogLevel(level);
    }
}

LogLevel ObservedLogger::getLogLevel() const {
    return inner ? inner->getLogLevel() : LogLevel::INFO;
}

void ObservedLogger::log(LogLevel level, const std::string& message) {
    if (inner) {
        inner->log(level, message);
    }
    if (!sink || level == LogLevel::DEBUG) {
        return;
    }
    switch (level) {
        case LogLevel::WARNING:
            sink("Warning: " + message);
            break;
        case LogLevel::ERROR_LEVEL:
            sink("Error: " + message);
            break;
        default:
            sink(message);
            break;
    }
}
