#pragma once
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "utils/ILogger.hpp"

namespace fs = std::filesystem;

// 模拟ILogger接口
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, setLogLevel, (LogLevel level), (override));
    MOCK_METHOD(LogLevel, getLogLevel, (), (const, override));
    MOCK_METHOD(void, log, (LogLevel level, const std::string& message), (override));
};

// 允许所有日志方法调用，个别用例再追加更具体的期望
inline void allowAnyLogging(MockLogger& logger) {
    EXPECT_CALL(logger, log(::testing::_, ::testing::_)).WillRepeatedly(::testing::Return());
    EXPECT_CALL(logger, setLogLevel(::testing::_)).WillRepeatedly(::testing::Return());
    EXPECT_CALL(logger, getLogLevel()).WillRepeatedly(::testing::Return(LogLevel::DEBUG));
    EXPECT_CALL(logger, info(::testing::_)).WillRepeatedly(::testing::Return());
    EXPECT_CALL(logger, error(::testing::_)).WillRepeatedly(::testing::Return());
    EXPECT_CALL(logger, warn(::testing::_)).WillRepeatedly(::testing::Return());
    EXPECT_CALL(logger, debug(::testing::_)).WillRepeatedly(::testing::Return());
}

inline void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// 每个测试使用独立的临时目录，测试可以并行运行
inline fs::path testDirectory(const std::string& prefix) {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string suffix = info ? std::string(info->test_suite_name()) + "_" + info->name() : "shared";
    return fs::temp_directory_path() / (prefix + "_" + suffix);
}
