#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include <cstdint>
#include "models/Job.hpp"
#include "models/Transfer.hpp"

class ILogger;
class ITargetConnector;

struct TransferItem {
    std::string sourcePath;
    std::string destinationPath;
    uint64_t fileSize = 0;
};

struct TransferPlan {
    std::vector<TransferItem> items;
    int omittedFiles = 0;      // 无法读取大小而未列入计划
    int downgradedRenames = 0; // rename次数耗尽后退化为覆盖
};

struct PlanTotals {
    int fileCount = 0;
    uint64_t totalBytes = 0;
};

// 把扫描结果映射为有序的传输计划
// 目标路径 = 目标根 / 作业名 / 源文件名，不保留源目录结构
class TransferPlanner {
public:
    explicit TransferPlanner(ILogger* logger, int renameMaxAttempts = 9999);

    // finishedSources中的文件（本次执行已完成或已跳过）不进入计划
    TransferPlan plan(const Job& job, const std::string& destinationRoot,
                      const std::vector<std::string>& files,
                      const std::set<std::string>& finishedSources,
                      ITargetConnector& connector) const;

    // 可读取大小的文件数与总字节数，作为新执行的总量
    PlanTotals measure(const std::vector<std::string>& files) const;

    // 与上次校验通过的传输相比未变化的文件，以skipped记录带入新执行
    std::vector<Transfer> carryOver(const std::vector<std::string>& files,
                                    const std::map<std::string, Transfer>& previous,
                                    ITargetConnector& connector) const;

    static std::string destinationFor(const std::string& destinationRoot, const std::string& jobName,
                                      const std::string& sourcePath);

private:
    ILogger* logger;
    int renameMaxAttempts;
};
