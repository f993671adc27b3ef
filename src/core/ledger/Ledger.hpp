#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <memory>
#include <mutex>
#include <cstdint>
#include "LedgerError.hpp"
#include "../models/Job.hpp"
#include "../models/Execution.hpp"
#include "../models/Transfer.hpp"

class SqliteDB;
class Statement;

// 作业、执行、传输记录的持久化存储
// 每个写操作是一次独立提交的事务；失败抛出LedgerError
// 同一实例可被多个线程使用，内部串行化
class Ledger {
public:
    static constexpr int SCHEMA_VERSION = 2;

    // 打开（或创建）数据库并完成迁移
    explicit Ledger(const std::string& databasePath);
    ~Ledger();

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    int getSchemaVersion();
    std::string getDatabasePath() const;

    // ---- 作业 ----
    int64_t createJob(const Job& job);
    std::optional<Job> getJob(int64_t jobId);
    std::vector<Job> listJobs(bool activeOnly = true);
    // 仅清除active标志，历史记录保留
    bool softDeleteJob(int64_t jobId);
    // 级联删除该作业的执行和传输记录
    bool deleteJob(int64_t jobId);

    // ---- 执行 ----
    // 新建running状态的执行；该作业已有未结束的执行时抛出Conflict
    Execution createExecution(int64_t jobId);
    std::optional<Execution> getExecution(int64_t executionId);
    std::vector<Execution> listExecutions(int64_t jobId);
    // running或paused
    std::optional<Execution> findActiveExecution(int64_t jobId);
    std::optional<Execution> findPausedExecution(int64_t jobId);
    std::vector<Execution> listPausedExecutions();

    void setExecutionTotals(int64_t executionId, int totalFiles, uint64_t totalBytes);
    void markExecutionPaused(int64_t executionId);
    void markExecutionResumed(int64_t executionId);
    // status必须是终态
    void finishExecution(int64_t executionId, ExecutionStatus status, const std::string& errorMessage = "");

    // 上次进程退出时仍为running的执行改为paused，返回受影响数量
    int recoverInterruptedExecutions();

    // 删除完成时间早于daysToKeep天前的终态执行及其传输，返回删除数量
    int purgeTerminalExecutions(int daysToKeep);

    // ---- 传输 ----
    // 开始（或重试）一个文件的传输：每个源路径在一次执行中只有一行，重试时retry_count加一
    Transfer beginTransfer(int64_t executionId, const std::string& sourcePath,
                           const std::string& destinationPath, uint64_t fileSize);
    // status为COMPLETED或SKIPPED；同时刷新执行计数
    void completeTransfer(int64_t transferId, TransferStatus status, const std::string& destinationPath,
                          const std::string& checksum, uint64_t transferredBytes);
    void failTransfer(int64_t transferId, const std::string& errorMessage);

    // 把未变化文件以skipped记录写入执行，一次事务
    void recordCarriedTransfers(int64_t executionId, const std::vector<Transfer>& transfers);

    std::vector<Transfer> listTransfers(int64_t executionId);
    // completed或skipped的源路径
    std::set<std::string> finishedSourcePaths(int64_t executionId);
    // 该作业其他执行中每个源路径最近一次带摘要的传输
    std::map<std::string, Transfer> latestVerifiedTransfers(int64_t jobId, int64_t excludeExecutionId);

private:
    void migrate();
    bool hasColumn(const std::string& table, const std::string& column);
    int readSchemaVersion();

    std::optional<Execution> loadExecution(int64_t executionId);
    std::optional<Transfer> loadTransfer(int64_t transferId);
    ExecutionStatus requireOpenExecution(int64_t executionId);
    void refreshCounters(int64_t executionId);

    std::unique_ptr<SqliteDB> db;
    mutable std::mutex mutex;
};
