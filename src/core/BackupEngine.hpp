#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <cstdint>
#include "Types.hpp"
#include "EngineSettings.hpp"
#include "ExecutionContext.hpp"
#include "ExecutionController.hpp"
#include "EventDispatcher.hpp"
#include "models/Execution.hpp"
#include "models/Job.hpp"
#include "connectors/ITargetConnector.hpp"
#include "../utils/ObservedLogger.hpp"

class ILogger;
class Ledger;
class ConnectorFactory;

// 备份执行引擎
// 全进程同一时刻只运行一个执行；执行在独立的工作线程上进行，
// 进度、日志与完成通知由EventDispatcher在另一个线程上按顺序回调
class BackupEngine {
public:
    using ProgressCallback = std::function<void(int processed, int total, const std::string& label)>;
    using LogCallback = std::function<void(const std::string& message)>;
    using CompletionCallback = std::function<void(bool success, const std::string& message)>;

    // factory为空时使用默认的连接器工厂
    BackupEngine(Ledger& ledger, ILogger* logger, const EngineSettings& settings = EngineSettings(),
                 std::shared_ptr<ConnectorFactory> factory = nullptr);
    ~BackupEngine();

    BackupEngine(const BackupEngine&) = delete;
    BackupEngine& operator=(const BackupEngine&) = delete;

    void setProgressCallback(ProgressCallback callback);
    void setLogCallback(LogCallback callback);
    void setCompletionCallback(CompletionCallback callback);

    // 已有执行在运行、作业不存在或未激活、目标不可用时返回false，不写账本
    bool startJob(int64_t jobId);

    bool pause();
    bool resume();
    bool stop();
    // 暂停并在保存检查点后结束工作线程
    bool suspend();

    bool isRunning() const;
    bool isPaused() const;
    std::optional<int64_t> currentJobId() const;
    std::optional<ExecutionOutcome> lastOutcome() const;

    // 等待工作线程结束且回调全部送达
    bool waitForIdle(std::chrono::milliseconds timeout);

    // 运行中的执行先挂起为paused，最多等待timeout；之后停止回调线程
    // 超时返回false且不等待工作线程，调用方应直接退出进程
    bool shutdown(std::chrono::milliseconds timeout);

    int recoverInterruptedExecutions();
    std::vector<Execution> listPausedExecutions();
    int purgeTerminalExecutions(int daysToKeep);

private:
    void workerMain(Job job, std::unique_ptr<ITargetConnector> connector);
    ExecutionController makeController();
    void publishLog(const std::string& message);
    void publishProgress(int processed, int total, const std::string& label);
    void publishCompletion(bool success, const std::string& message);
    void joinWorker();

    Ledger& ledger;
    ILogger* logger;
    EngineSettings settings;
    std::shared_ptr<ConnectorFactory> factory;
    ExecutionContext context;
    EventDispatcher dispatcher;
    // 执行期间的日志同时发布给日志回调
    ObservedLogger observedLogger;

    std::thread worker;
    mutable std::mutex stateMutex;
    std::condition_variable idleCv;
    bool running;
    bool shutDown;
    std::optional<int64_t> jobId;
    std::optional<ExecutionOutcome> outcome;

    mutable std::mutex callbackMutex;
    ProgressCallback progressCallback;
    LogCallback logCallback;
    CompletionCallback completionCallback;
};
