#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include "../Types.hpp"

// 作业的一次运行
struct Execution {
    using TimePoint = std::chrono::system_clock::time_point;

    int64_t id = 0;
    int64_t jobId = 0;
    ExecutionStatus status = ExecutionStatus::PENDING;
    TimePoint startedAt;
    std::optional<TimePoint> completedAt;
    std::optional<TimePoint> pausedAt;
    std::optional<TimePoint> resumedAt;
    int totalFiles = 0;
    int processedFiles = 0;
    int failedFiles = 0;
    uint64_t totalBytes = 0;
    uint64_t transferredBytes = 0;
    std::string errorMessage;

    // 进度百分比 [0, 100]
    int progressPercentage() const;

    // 平均传输速率（MB/s），未结束的执行按当前时间计算
    double transferRateMBps(TimePoint now = std::chrono::system_clock::now()) const;
};
