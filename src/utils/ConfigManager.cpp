#include "ConfigManager.hpp"
#include <json/json.h>
#include <fstream>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

// 非法取值一律回退到默认值
static int positiveOr(const Json::Value& root, const char* key, int fallback) {
    if (!root.isMember(key) || !root[key].isInt()) {
        return fallback;
    }
    int value = root[key].asInt();
    return value > 0 ? value : fallback;
}

AppConfig ConfigManager::load(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + configFile);
    }

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        throw std::runtime_error("Failed to parse config file: " + configFile + " (" + errors + ")");
    }
    if (!root.isObject()) {
        throw std::runtime_error("Config file must contain a JSON object: " + configFile);
    }

    AppConfig config;
    config.databasePath = root.get("database_path", config.databasePath).asString();
    config.logDirectory = root.get("log_directory", config.logDirectory).asString();

    LogLevel level;
    if (parseLogLevel(root.get("log_level", "INFO").asString(), level)) {
        config.logLevel = level;
    }

    config.maxLogFiles = positiveOr(root, "max_log_files", config.maxLogFiles);
    config.hashChunkSize = positiveOr(root, "hash_chunk_size", config.hashChunkSize);
    config.pausePollIntervalMs = positiveOr(root, "pause_poll_interval_ms", config.pausePollIntervalMs);
    config.shutdownTimeoutMs = positiveOr(root, "shutdown_timeout_ms", config.shutdownTimeoutMs);
    config.renameMaxAttempts = positiveOr(root, "rename_max_attempts", config.renameMaxAttempts);
    config.retentionDays = positiveOr(root, "retention_days", config.retentionDays);
    return config;
}

AppConfig ConfigManager::loadOrDefault(const std::string& configFile) {
    std::error_code ec;
    if (configFile.empty() || !fs::exists(configFile, ec)) {
        return AppConfig();
    }
    return load(configFile);
}

bool ConfigManager::save(const AppConfig& config, const std::string& configFile) {
    Json::Value root;
    root["database_path"] = config.databasePath;
    root["log_directory"] = config.logDirectory;
    root["log_level"] = logLevelName(config.logLevel);
    root["max_log_files"] = config.maxLogFiles;
    root["hash_chunk_size"] = config.hashChunkSize;
    root["pause_poll_interval_ms"] = config.pausePollIntervalMs;
    root["shutdown_timeout_ms"] = config.shutdownTimeoutMs;
    root["rename_max_attempts"] = config.renameMaxAttempts;
    root["retention_days"] = config.retentionDays;

    std::ofstream file(configFile, std::ios::trunc);
    if (!file) {
        return false;
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(root, &file);
    file << "\n";
    return static_cast<bool>(file);
}
