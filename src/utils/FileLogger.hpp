#pragma once
#include "ILogger.hpp"
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>

// 写入 logDirectory/backup_<时间戳>.log，打开时只保留最近 maxLogFiles 个日志文件
class FileLogger : public ILogger {
public:
    FileLogger(const std::string& logDirectory, int maxLogFiles, LogLevel level = LogLevel::DEBUG);
    ~FileLogger() override;

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    bool isOpen() const;
    const std::string& getLogFilePath() const;

    void info(const std::string& message) override;
    void error(const std::string& message) override;
    void warn(const std::string& message) override;
    void debug(const std::string& message) override;
    void setLogLevel(LogLevel level) override;
    LogLevel getLogLevel() const override;
    void log(LogLevel level, const std::string& message) override;

    // 删除多余的旧日志，返回删除数量
    static int cleanupOldLogs(const std::string& logDirectory, int maxLogFiles);

private:
    std::string logFilePath;
    std::ofstream stream;
    std::atomic<LogLevel> level;
    std::mutex outputMutex;
};
