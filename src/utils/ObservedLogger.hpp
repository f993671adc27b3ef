#pragma once
#include "ILogger.hpp"
#include <functional>
#include <string>

// 执行期间使用的日志装饰器：写入内部日志，同时把INFO及以上级别发布给观察者
class ObservedLogger : public ILogger {
public:
    using Sink = std::function<void(const std::string&)>;

    ObservedLogger(ILogger* inner, Sink sink);

    void info(const std::string& message) override;
    void error(const std::string& message) override;
    void warn(const std::string& message) override;
    void debug(const std::string& message) override;
    void setLogLevel(LogLevel level) override;
    LogLevel getLogLevel() const override;
    void log(LogLevel level, const std::string& message) override;

private:
    ILogger* inner;
    Sink sink;
};
