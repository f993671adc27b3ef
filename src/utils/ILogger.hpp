#pragma once
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL
};

// 日志接口；实现需保证可被执行线程与调用线程同时使用
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void info(const std::string& message) = 0;

    virtual void error(const std::string& message) = 0;

    virtual void warn(const std::string& message) = 0;
    
    virtual void debug(const std::string& message) = 0;
    
    virtual void setLogLevel(LogLevel level) = 0;
    
    virtual LogLevel getLogLevel() const = 0;
    
    virtual void log(LogLevel level, const std::string& message) = 0;
};

// 本地时间 "YYYY-mm-dd HH:MM:SS"
std::string currentTimestamp();

std::string logLevelName(LogLevel level);

// 接受 DEBUG / INFO / WARN / WARNING / ERROR
bool parseLogLevel(const std::string& text, LogLevel& level);
