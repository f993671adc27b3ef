#pragma once
#include <string>
#include <functional>
#include <cstdint>
#include <memory>
#include "Types.hpp"
#include "EngineSettings.hpp"
#include "models/Job.hpp"

class Ledger;
class ConnectorFactory;
class ExecutionContext;
class ITargetConnector;
class ILogger;
struct TransferItem;

// 一次执行的结果
struct ExecutionOutcome {
    bool success = false;            // completed / completed_with_errors / 挂起为paused
    bool rejected = false;           // 未创建执行记录就被拒绝
    int64_t executionId = 0;
    ExecutionStatus status = ExecutionStatus::FAILED;
    std::string message;
};

// 驱动一次执行：扫描、计划、逐个传输、处理暂停和停止、结束
// 在执行线程上同步运行，暂停和停止通过ExecutionContext传入
class ExecutionController {
public:
    using ProgressSink = std::function<void(int processed, int total, const std::string& label)>;

    // logger应当已经把消息转发给观察者（见ObservedLogger）
    ExecutionController(Ledger& ledger, const ConnectorFactory& factory, ExecutionContext& context,
                        ILogger* logger, ProgressSink progress, const EngineSettings& settings);

    // 读取作业并初始化目标，失败时不写账本，原因放在error中
    bool prepare(int64_t jobId, Job& job, std::unique_ptr<ITargetConnector>& connector, std::string& error);

    // connector须已初始化
    ExecutionOutcome run(const Job& job, ITargetConnector& connector);

    // prepare + run
    ExecutionOutcome run(int64_t jobId);

private:
    // 处理暂停/停止信号；返回true表示run应立即返回
    bool checkpoint(int64_t executionId, ExecutionOutcome& outcome);

    void cancel(int64_t executionId, ExecutionOutcome& outcome);
    void finalize(int64_t executionId, ExecutionOutcome& outcome);
    void transferOne(const Job& job, int64_t executionId, const TransferItem& item,
                     ITargetConnector& connector);
    void emitProgress(int64_t executionId, const std::string& label);

    Ledger& ledger;
    const ConnectorFactory& factory;
    ExecutionContext& context;
    ILogger* logger;
    ProgressSink progress;
    EngineSettings settings;
};
