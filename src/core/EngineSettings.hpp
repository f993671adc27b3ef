#pragma once
#include <chrono>
#include <cstddef>
#include "../utils/ConfigManager.hpp"

// 执行引擎的运行参数
struct EngineSettings {
    std::chrono::milliseconds pausePollInterval{1000};
    std::chrono::milliseconds shutdownTimeout{5000};
    size_t hashChunkSize = 8192;
    int renameMaxAttempts = 9999;

    static EngineSettings fromConfig(const AppConfig& config) {
        EngineSettings settings;
        settings.pausePollInterval = std::chrono::milliseconds(config.pausePollIntervalMs);
        settings.shutdownTimeout = std::chrono::milliseconds(config.shutdownTimeoutMs);
        settings.hashChunkSize = static_cast<size_t>(config.hashChunkSize);
        settings.renameMaxAttempts = config.renameMaxAttempts;
        return settings;
    }
};
