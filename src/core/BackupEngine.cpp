#include "BackupEngine.hpp"
#include "connectors/ConnectorFactory.hpp"
#include "ledger/Ledger.hpp"
#include "../utils/ILogger.hpp"

BackupEngine::BackupEngine(Ledger& ledger, ILogger* logger, const EngineSettings& settings,
                           std::shared_ptr<ConnectorFactory> factory)
    : ledger(ledger), logger(logger), settings(settings), factory(std::move(factory)),
      context(settings.pausePollInterval), dispatcher(logger),
      observedLogger(logger, [this](const std::string& message) { publishLog(message); }),
      running(false), shutDown(false) {
    if (!this->factory) {
        this->factory = std::make_shared<ConnectorFactory>(settings.hashChunkSize, settings.renameMaxAttempts);
    }
}

BackupEngine::~BackupEngine() {
    shutdown(settings.shutdownTimeout);
    // 超时后工作线程仍可能持有本对象，析构必须等它结束
    joinWorker();
}

void BackupEngine::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex);
    progressCallback = std::move(callback);
}

void BackupEngine::setLogCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex);
    logCallback = std::move(callback);
}

void BackupEngine::setCompletionCallback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex);
    completionCallback = std::move(callback);
}

bool BackupEngine::startJob(int64_t jobId) {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (shutDown) {
        logger->error("Backup engine has been shut down");
        return false;
    }
    if (running) {
        logger->error("Another backup is already running (job " + std::to_string(*this->jobId) + ")");
        return false;
    }

    // 上一个工作线程已经结束，只需回收
    if (worker.joinable()) {
        worker.join();
    }

    Job job;
    std::unique_ptr<ITargetConnector> connector;
    std::string error;
    if (!makeController().prepare(jobId, job, connector, error)) {
        return false;
    }

    context.reset();
    running = true;
    this->jobId = jobId;
    outcome.reset();
    worker = std::thread(&BackupEngine::workerMain, this, std::move(job), std::move(connector));
    return true;
}

ExecutionController BackupEngine::makeController() {
    return ExecutionController(
        ledger, *factory, context, &observedLogger,
        [this](int processed, int total, const std::string& label) { publishProgress(processed, total, label); },
        settings);
}

void BackupEngine::workerMain(Job job, std::unique_ptr<ITargetConnector> connector) {
    ExecutionOutcome result = makeController().run(job, *connector);
    connector.reset();
    publishCompletion(result.success, result.message);

    {
        std::lock_guard<std::mutex> lock(stateMutex);
        outcome = result;
        running = false;
        this->jobId.reset();
    }
    idleCv.notify_all();
}

bool BackupEngine::pause() {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (!running) {
        logger->warn("No backup is currently running");
        return false;
    }
    if (context.isPauseRequested()) {
        return false;
    }
    context.requestPause();
    logger->info("Backup pause requested");
    return true;
}

bool BackupEngine::resume() {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (!running || !context.isPauseRequested()) {
        logger->warn("No paused backup to resume");
        return false;
    }
    if (context.isSuspendRequested()) {
        logger->warn("Backup is being suspended and cannot be resumed in place");
        return false;
    }
    context.requestResume();
    logger->info("Backup resume requested");
    return true;
}

bool BackupEngine::stop() {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (!running) {
        logger->warn("No backup is currently running");
        return false;
    }
    context.requestStop();
    logger->info("Backup stop requested");
    return true;
}

bool BackupEngine::suspend() {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (!running) {
        return false;
    }
    context.requestSuspend();
    logger->info("Backup suspend requested");
    return true;
}

bool BackupEngine::isRunning() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return running;
}

bool BackupEngine::isPaused() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return running && context.isPauseRequested();
}

std::optional<int64_t> BackupEngine::currentJobId() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return jobId;
}

std::optional<ExecutionOutcome> BackupEngine::lastOutcome() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return outcome;
}

bool BackupEngine::waitForIdle(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    {
        std::unique_lock<std::mutex> lock(stateMutex);
        if (!idleCv.wait_until(lock, deadline, [this]() { return !running; })) {
            return false;
        }
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return dispatcher.flush(remaining.count() > 0 ? remaining : std::chrono::milliseconds(0));
}

void BackupEngine::joinWorker() {
    if (worker.joinable()) {
        worker.join();
    }
}

bool BackupEngine::shutdown(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (shutDown) {
            return !running;
        }
        shutDown = true;
        if (running) {
            logger->info("Suspending running backup before shutdown");
            context.requestSuspend();
        }
    }

    bool suspended = true;
    {
        std::unique_lock<std::mutex> lock(stateMutex);
        suspended = idleCv.wait_for(lock, timeout, [this]() { return !running; });
    }
    if (suspended) {
        joinWorker();
    } else {
        // 不再等待当前文件；临时文件不会落到目标路径，running记录由下次启动时的恢复改为paused
        logger->warn("Backup did not reach a checkpoint within " +
                     std::to_string(timeout.count()) + " ms, leaving it to recovery");
    }
    dispatcher.stop();
    return suspended;
}

int BackupEngine::recoverInterruptedExecutions() {
    int recovered = ledger.recoverInterruptedExecutions();
    if (recovered > 0) {
        logger->info("Recovered " + std::to_string(recovered) + " interrupted executions as paused");
    }
    return recovered;
}

std::vector<Execution> BackupEngine::listPausedExecutions() {
    return ledger.listPausedExecutions();
}

int BackupEngine::purgeTerminalExecutions(int daysToKeep) {
    int removed = ledger.purgeTerminalExecutions(daysToKeep);
    logger->info("Removed " + std::to_string(removed) + " executions older than " +
                 std::to_string(daysToKeep) + " days");
    return removed;
}

void BackupEngine::publishLog(const std::string& message) {
    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        callback = logCallback;
    }
    if (callback) {
        dispatcher.post([callback, message]() { callback(message); });
    }
}

void BackupEngine::publishProgress(int processed, int total, const std::string& label) {
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        callback = progressCallback;
    }
    if (callback) {
        dispatcher.post([callback, processed, total, label]() { callback(processed, total, label); });
    }
}

void BackupEngine::publishCompletion(bool success, const std::string& message) {
    CompletionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        callback = completionCallback;
    }
    if (callback) {
        dispatcher.post([callback, success, message]() { callback(success, message); });
    }
}
