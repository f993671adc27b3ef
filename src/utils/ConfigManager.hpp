#pragma once
#include <string>
#include "ILogger.hpp"

// 应用配置，缺省值即为未配置时的行为
struct AppConfig {
    std::string databasePath = "backupkeeper.db";
    std::string logDirectory = "logs";
    LogLevel logLevel = LogLevel::INFO;
    int maxLogFiles = 10;
    int hashChunkSize = 8192;
    int pausePollIntervalMs = 1000;  // 暂停时重新检查停止标志的间隔
    int shutdownTimeoutMs = 5000;    // 退出前等待执行进入暂停的上限
    int renameMaxAttempts = 9999;    // 超过后退化为覆盖
    int retentionDays = 30;
};

class ConfigManager {
public:
    // 从JSON文件加载；文件无法打开或解析失败时抛出std::runtime_error
    static AppConfig load(const std::string& configFile);

    // 文件不存在时返回默认配置
    static AppConfig loadOrDefault(const std::string& configFile);

    static bool save(const AppConfig& config, const std::string& configFile);
};
