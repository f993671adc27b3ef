#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>
#include <string>
#include "utils/ConfigManager.hpp"
#include "core/EngineSettings.hpp"
#include "TestHelpers.hpp"

class ConfigManagerTest : public ::testing::Test {
protected:
    fs::path testDir = testDirectory("backupkeeper_config_test");
    fs::path configFile = testDir / "config.json";

    void SetUp() override {
        fs::remove_all(testDir);
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

TEST_F(ConfigManagerTest, MissingFileGivesDefaults) {
    AppConfig config = ConfigManager::loadOrDefault(configFile.string());
    EXPECT_EQ("backupkeeper.db", config.databasePath);
    EXPECT_EQ(LogLevel::INFO, config.logLevel);
    EXPECT_EQ(8192, config.hashChunkSize);
    EXPECT_EQ(9999, config.renameMaxAttempts);
    EXPECT_THROW(ConfigManager::load(configFile.string()), std::runtime_error);
}

TEST_F(ConfigManagerTest, ReadsKnownKeys) {
    writeFile(configFile, R"({
        "database_path": "/var/lib/keeper.db",
        "log_directory": "/var/log/keeper",
        "log_level": "WARN",
        "max_log_files": 3,
        "hash_chunk_size": 65536,
        "pause_poll_interval_ms": 250,
        "shutdown_timeout_ms": 2000,
        "rename_max_attempts": 50,
        "retention_days": 7
    })");
    AppConfig config = ConfigManager::load(configFile.string());
    EXPECT_EQ("/var/lib/keeper.db", config.databasePath);
    EXPECT_EQ("/var/log/keeper", config.logDirectory);
    EXPECT_EQ(LogLevel::WARNING, config.logLevel);
    EXPECT_EQ(3, config.maxLogFiles);
    EXPECT_EQ(7, config.retentionDays);

    EngineSettings settings = EngineSettings::fromConfig(config);
    EXPECT_EQ(std::chrono::milliseconds(250), settings.pausePollInterval);
    EXPECT_EQ(std::chrono::milliseconds(2000), settings.shutdownTimeout);
    EXPECT_EQ(65536u, settings.hashChunkSize);
    EXPECT_EQ(50, settings.renameMaxAttempts);
}

TEST_F(ConfigManagerTest, InvalidValuesFallBackToDefaults) {
    writeFile(configFile, R"({"hash_chunk_size": -1, "rename_max_attempts": "many", "log_level": "LOUD"})");
    AppConfig config = ConfigManager::load(configFile.string());
    EXPECT_EQ(8192, config.hashChunkSize);
    EXPECT_EQ(9999, config.renameMaxAttempts);
    EXPECT_EQ(LogLevel::INFO, config.logLevel);
}

TEST_F(ConfigManagerTest, MalformedFileThrows) {
    writeFile(configFile, "{ not json");
    EXPECT_THROW(ConfigManager::load(configFile.string()), std::runtime_error);
    writeFile(configFile, "[1, 2]");
    EXPECT_THROW(ConfigManager::loadOrDefault(configFile.string()), std::runtime_error);
}

TEST_F(ConfigManagerTest, SavedConfigLoadsBack) {
    AppConfig config;
    config.databasePath = "other.db";
    config.logLevel = LogLevel::DEBUG;
    config.retentionDays = 90;
    ASSERT_TRUE(ConfigManager::save(config, configFile.string()));

    AppConfig loaded = ConfigManager::load(configFile.string());
    EXPECT_EQ("other.db", loaded.databasePath);
    EXPECT_EQ(LogLevel::DEBUG, loaded.logLevel);
    EXPECT_EQ(90, loaded.retentionDays);
}
