#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include "../Types.hpp"

// 一次执行中单个文件的传输记录
struct Transfer {
    int64_t id = 0;
    int64_t executionId = 0;
    std::string sourcePath;
    std::string destinationPath;
    uint64_t fileSize = 0;
    TransferStatus status = TransferStatus::PENDING;
    std::string checksum;          // 校验通过后的SHA-256
    uint64_t transferredBytes = 0;
    int retryCount = 0;
    std::string errorMessage;
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> completedAt;
};
