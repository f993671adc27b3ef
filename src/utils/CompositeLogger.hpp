#pragma once
#include "ILogger.hpp"
#include <vector>

// 将日志同时分发给多个日志记录器（不持有所有权）
class CompositeLogger : public ILogger {
public:
    CompositeLogger() = default;
    explicit CompositeLogger(std::vector<ILogger*> loggers);

    void addLogger(ILogger* logger);

    void info(const std::string& message) override;
    void error(const std::string& message) override;
    void warn(const std::string& message) override;
    void debug(const std::string& message) override;
    void setLogLevel(LogLevel level) override;
    LogLevel getLogLevel() const override;
    void log(LogLevel level, const std::string& message) override;

private:
    std::vector<ILogger*> loggers;
    LogLevel level = LogLevel::DEBUG;
};
