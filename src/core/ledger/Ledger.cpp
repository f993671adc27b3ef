#include "Ledger.hpp"
#include "SqliteDB.hpp"
#include "SqliteTransaction.hpp"
#include <json/json.h>
#include <chrono>
#include <memory>
#include <sstream>

namespace {

using Clock = std::chrono::system_clock;

// 时间统一以毫秒时间戳保存
int64_t toMillis(Clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

Clock::time_point fromMillis(int64_t millis) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

int64_t nowMillis() {
    return toMillis(Clock::now());
}

std::optional<Clock::time_point> optionalTime(const Statement& stmt, int column) {
    if (stmt.isNull(column)) {
        return std::nullopt;
    }
    return fromMillis(stmt.columnInt64(column));
}

std::string toJsonArray(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, array);
}

std::vector<std::string> fromJsonArray(const std::string& text) {
    std::vector<std::string> values;
    if (text.empty()) {
        return values;
    }
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream in(text);
    if (!Json::parseFromStream(builder, in, &root, &errors) || !root.isArray()) {
        throw LedgerError(LedgerErrorCode::Corruption, "Malformed JSON list in ledger: " + text);
    }
    for (const auto& value : root) {
        values.push_back(value.asString());
    }
    return values;
}

const char* const JOB_COLUMNS =
    "id, name, sources, include_patterns, exclude_patterns, destination_type, destination_config, "
    "conflict_policy, schedule, is_active, created_at, updated_at";

const char* const EXECUTION_COLUMNS =
    "id, job_id, status, started_at, completed_at, paused_at, resumed_at, total_files, "
    "processed_files, failed_files, total_bytes, transferred_bytes, error_message";

const char* const TRANSFER_COLUMNS =
    "id, execution_id, source_path, destination_path, file_size, status, checksum, "
    "transferred_bytes, retry_count, error_message, started_at, completed_at";

const char* const OPEN_STATUSES = "('pending','running','paused')";
const char* const TERMINAL_STATUSES = "('completed','completed_with_errors','failed','cancelled')";

Job readJob(const Statement& stmt) {
    Job job;
    job.id = stmt.columnInt64(0);
    job.name = stmt.columnText(1);
    job.sources = fromJsonArray(stmt.columnText(2));
    job.includePatterns = fromJsonArray(stmt.columnText(3));
    job.excludePatterns = fromJsonArray(stmt.columnText(4));
    job.destinationType = stmt.columnText(5);
    job.destinationConfig = stmt.isNull(6) ? "{}" : stmt.columnText(6);
    ConflictPolicy policy;
    if (!parseConflictPolicy(stmt.columnText(7), policy)) {
        throw LedgerError(LedgerErrorCode::Corruption, "Unknown conflict policy: " + stmt.columnText(7));
    }
    job.conflictPolicy = policy;
    job.schedule = stmt.columnText(8);
    job.active = stmt.columnInt(9) != 0;
    job.createdAt = fromMillis(stmt.columnInt64(10));
    job.updatedAt = fromMillis(stmt.columnInt64(11));
    return job;
}

Execution readExecution(const Statement& stmt) {
    Execution execution;
    execution.id = stmt.columnInt64(0);
    execution.jobId = stmt.columnInt64(1);
    ExecutionStatus status;
    if (!parseExecutionStatus(stmt.columnText(2), status)) {
        throw LedgerError(LedgerErrorCode::Corruption, "Unknown execution status: " + stmt.columnText(2));
    }
    execution.status = status;
    execution.startedAt = fromMillis(stmt.columnInt64(3));
    execution.completedAt = optionalTime(stmt, 4);
    execution.pausedAt = optionalTime(stmt, 5);
    execution.resumedAt = optionalTime(stmt, 6);
    execution.totalFiles = stmt.columnInt(7);
    execution.processedFiles = stmt.columnInt(8);
    execution.failedFiles = stmt.columnInt(9);
    execution.totalBytes = static_cast<uint64_t>(stmt.columnInt64(10));
    execution.transferredBytes = static_cast<uint64_t>(stmt.columnInt64(11));
    execution.errorMessage = stmt.columnText(12);
    return execution;
}

Transfer readTransfer(const Statement& stmt) {
    Transfer transfer;
    transfer.id = stmt.columnInt64(0);
    transfer.executionId = stmt.columnInt64(1);
    transfer.sourcePath = stmt.columnText(2);
    transfer.destinationPath = stmt.columnText(3);
    transfer.fileSize = static_cast<uint64_t>(stmt.columnInt64(4));
    TransferStatus status;
    if (!parseTransferStatus(stmt.columnText(5), status)) {
        throw LedgerError(LedgerErrorCode::Corruption, "Unknown transfer status: " + stmt.columnText(5));
    }
    transfer.status = status;
    transfer.checksum = stmt.columnText(6);
    transfer.transferredBytes = static_cast<uint64_t>(stmt.columnInt64(7));
    transfer.retryCount = stmt.columnInt(8);
    transfer.errorMessage = stmt.columnText(9);
    transfer.startedAt = optionalTime(stmt, 10);
    transfer.completedAt = optionalTime(stmt, 11);
    return transfer;
}

} // namespace

Ledger::Ledger(const std::string& databasePath) : db(std::make_unique<SqliteDB>(databasePath)) {
    migrate();
}

Ledger::~Ledger() = default;

int Ledger::getSchemaVersion() {
    std::lock_guard<std::mutex> lock(mutex);
    return readSchemaVersion();
}

std::string Ledger::getDatabasePath() const {
    return db->getPath();
}

// ---------------------------------------------------------------------------
// 作业
// ---------------------------------------------------------------------------

int64_t Ledger::createJob(const Job& job) {
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    int64_t now = nowMillis();
    Statement stmt(*db,
        "INSERT INTO jobs(name, sources, include_patterns, exclude_patterns, destination_type, "
        "destination_config, conflict_policy, schedule, is_active, created_at, updated_at) "
        "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?10);");
    stmt.bindText(1, job.name)
        .bindText(2, toJsonArray(job.sources))
        .bindText(3, toJsonArray(job.includePatterns))
        .bindText(4, toJsonArray(job.excludePatterns))
        .bindText(5, job.destinationType)
        .bindText(6, job.destinationConfig)
        .bindText(7, toString(job.conflictPolicy))
        .bindText(8, job.schedule)
        .bindInt64(9, job.active ? 1 : 0)
        .bindInt64(10, now);
    stmt.run();
    int64_t id = db->lastInsertId();
    tx.commit();
    return id;
}

std::optional<Job> Ledger::getJob(int64_t jobId) {
    std::lock_guard<std::mutex> lock(mutex);
    Statement stmt(*db, std::string("SELECT ") + JOB_COLUMNS + " FROM jobs WHERE id = ?1;");
    stmt.bindInt64(1, jobId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readJob(stmt);
}

std::vector<Job> Ledger::listJobs(bool activeOnly) {
    std::lock_guard<std::mutex> lock(mutex);
    std::string sql = std::string("SELECT ") + JOB_COLUMNS + " FROM jobs";
    if (activeOnly) {
        sql += " WHERE is_active = 1";
    }
    sql += " ORDER BY id;";
    Statement stmt(*db, sql);
    std::vector<Job> jobs;
    while (stmt.step()) {
        jobs.push_back(readJob(stmt));
    }
    return jobs;
}

bool Ledger::softDeleteJob(int64_t jobId) {
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    Statement stmt(*db, "UPDATE jobs SET is_active = 0, updated_at = ?2 WHERE id = ?1;");
    stmt.bindInt64(1, jobId).bindInt64(2, nowMillis());
    stmt.run();
    bool changed = db->changes() > 0;
    tx.commit();
    return changed;
}

bool Ledger::deleteJob(int64_t jobId) {
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    Statement stmt(*db, "DELETE FROM jobs WHERE id = ?1;");
    stmt.bindInt64(1, jobId);
    stmt.run();
    bool changed = db->changes() > 0;
    tx.commit();
    return changed;
}

// ---------------------------------------------------------------------------
// 执行
// ---------------------------------------------------------------------------

std::optional<Execution> Ledger::loadExecution(int64_t executionId) {
    Statement stmt(*db, std::string("SELECT ") + EXECUTION_COLUMNS + " FROM executions WHERE id = ?1;");
    stmt.bindInt64(1, executionId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readExecution(stmt);
}

ExecutionStatus Ledger::requireOpenExecution(int64_t executionId) {
    auto execution = loadExecution(executionId);
    if (!execution) {
        throw LedgerError(LedgerErrorCode::NotFound, "Execution " + std::to_string(executionId) + " not found");
    }
    if (isTerminal(execution->status)) {
        throw LedgerError(LedgerErrorCode::Conflict,
                          "Execution " + std::to_string(executionId) + " is already " + toString(execution->status));
    }
    return execution->status;
}

Execution Ledger::createExecution(int64_t jobId) {
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);

    Statement job(*db, "SELECT 1 FROM jobs WHERE id = ?1;");
    job.bindInt64(1, jobId);
    if (!job.step()) {
        throw LedgerError(LedgerErrorCode::NotFound, "Job " + std::to_string(jobId) + " not found");
    }

    Statement open(*db, std::string("SELECT id FROM executions WHERE job_id = ?1 AND status IN ") +
                        OPEN_STATUSES + ";");
    open.bindInt64(1, jobId);
    if (open.step()) {
        throw LedgerError(LedgerErrorCode::Conflict,
                          "Job " + std::to_string(jobId) + " already has an unfinished execution " +
                          std::to_string(open.columnInt64(0)));
    }

    Statement insert(*db, "INSERT INTO executions(job_id, status, started_at) VALUES(?1, 'running', ?2);");
    insert.bindInt64(1, jobId).bindInt64(2, nowMillis());
    insert.run();
    int64_t id = db->lastInsertId();

    auto execution = loadExecution(id);
    tx.commit();
    return *execution;
}

std::optional<Execution> Ledger::getExecution(int64_t executionId) {
    std::lock_guard<std::mutex> lock(mutex);
    return loadExecution(executionId);
}

std::vector<Execution> Ledger::listExecutions(int64_t jobId) {
    std::lock_guard<std::mutex> lock(mutex);
    Statement stmt(*db, std::string("SELECT ") + EXECUTION_COLUMNS +
                        " FROM executions WHERE job_id = ?1 ORDER BY started_at DESC, id DESC;");
    stmt.bindInt64(1, jobId);
    std::vector<Execution> executions;
    while (stmt.step()) {
        executions.push_back(readExecution(stmt));
    }
    return executions;
}

std::optional<Execution> Ledger::findActiveExecution(int64_t jobId) {
    std::lock_guard<std::mutex> lock(mutex);
    Statement stmt(*db, std::string("SELECT ") + EXECUTION_COLUMNS +
                        " FROM executions WHERE job_id = ?1 AND status IN ('running','paused') "
                        "ORDER BY id DESC LIMIT 1;");
    stmt.bindInt64(1, jobId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readExecution(stmt);
}

std::optional<Execution> Ledger::findPausedExecution(int64_t jobId) {
    std::lock_guard<std::mutex> lock(mutex);
    Statement stmt(*db, std::string("SELECT ") + EXECUTION_COLUMNS +
                        " FROM executions WHERE job_id = ?1 AND status = 'paused' "
                        "ORDER BY paused_at DESC, id DESC LIMIT 1;");
    stmt.bindInt64(1, jobId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readExecution(stmt);
}

std::vector<Execution> Ledger::listPausedExecutions() {
    std::lock_guard<std::mutex> lock(mutex);
    Statement stmt(*db, std::string("SELECT ") + EXECUTION_COLUMNS +
                        " FROM executions WHERE status = 'paused' ORDER BY paused_at DESC, id DESC;");
    std::vector<Execution> executions;
    while (stmt.step()) {
        executions.push_back(readExecution(stmt));
    }
    return executions;
}

void Ledger::setExecutionTotals(int64_t executionId, int totalFiles, uint64_t totalBytes) {
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    requireOpenExecution(executionId);
    Statement stmt(*db, "UPDATE executions SET total_files = ?2, total_bytes = ?3 WHERE id = ?1;");
    stmt.bindInt64(1, executionId)
        .bindInt64(2, totalFiles)
        .bindInt64(3, static_cast<int64_t>(totalBytes));
    stmt.run();
    tx.commit();
}

void Ledger::markExecutionPaused(int64_t executionId) {
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    ExecutionStatus status = requireOpenExecution(executionId);
    if (status == ExecutionStatus::PAUSED) {
        tx.commit();
        return;
    }
    Statement stmt(*db, "UPDATE executions SET status = 'paused', paused_at = ?2 WHERE id = ?1;");
    stmt.bindInt64(1, executionId).bindInt64(2, nowMillis());
    stmt.run();
    tx.commit();
}

void Ledger::markExecutionResumed(int64_t executionId) {
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    ExecutionStatus status = requireOpenExecution(executionId);
    if (status == ExecutionStatus::RUNNING) {
        tx.commit();
        return;
    }
    Statement stmt(*db, "UPDATE executions SET status = 'running', resumed_at = ?2 WHERE id = ?1;");
    stmt.bindInt64(1, executionId).bindInt64(2, nowMillis());
    stmt.run();
    tx.commit();
}

void Ledger::finishExecution(int64_t executionId, ExecutionStatus status, const std::string& errorMessage) {
    if (!isTerminal(status)) {
        throw LedgerError(LedgerErrorCode::Conflict,
                          "Cannot finish execution with non-terminal status " + toString(status));
    }
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    requireOpenExecution(executionId);
    Statement stmt(*db, "UPDATE executions SET status = ?2, completed_at = ?3, error_message = ?4 WHERE id = ?1;");
    stmt.bindInt64(1, executionId)
        .bindText(2, toString(status))
        .bindInt64(3, nowMillis());
    if (errorMessage.empty()) {
        stmt.bindNull(4);
    } else {
        stmt.bindText(4, errorMessage);
    }
    stmt.run();
    tx.commit();
}

int Ledger::recoverInterruptedExecutions() {
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    Statement stmt(*db, "UPDATE executions SET status = 'paused', paused_at = ?1 WHERE status = 'running';");
    stmt.bindInt64(1, nowMillis());
    stmt.run();
    int recovered = db->changes();
    tx.commit();
    return recovered;
}

int Ledger::purgeTerminalExecutions(int daysToKeep) {
    std::lock_guard<std::mutex> lock(mutex);
    int64_t cutoff = toMillis(Clock::now() - std::chrono::hours(24) * daysToKeep);
    SqliteTransaction tx(*db);
    // 传输记录通过外键级联删除
    Statement stmt(*db, std::string("DELETE FROM executions WHERE status IN ") + TERMINAL_STATUSES +
                        " AND completed_at IS NOT NULL AND completed_at < ?1;");
    stmt.bindInt64(1, cutoff);
    stmt.run();
    int removed = db->changes();
    tx.commit();
    return removed;
}

// ---------------------------------------------------------------------------
// 传输
// ---------------------------------------------------------------------------

std::optional<Transfer> Ledger::loadTransfer(int64_t transferId) {
    Statement stmt(*db, std::string("SELECT ") + TRANSFER_COLUMNS + " FROM transfers WHERE id = ?1;");
    stmt.bindInt64(1, transferId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readTransfer(stmt);
}

void Ledger::refreshCounters(int64_t executionId) {
    // 计数由传输记录推导，重试不会重复计数
    Statement stmt(*db,
        "UPDATE executions SET "
        "processed_files = (SELECT COUNT(*) FROM transfers WHERE execution_id = ?1 "
        "AND status IN ('completed','skipped','failed')), "
        "failed_files = (SELECT COUNT(*) FROM transfers WHERE execution_id = ?1 AND status = 'failed'), "
        "transferred_bytes = (SELECT COALESCE(SUM(transferred_bytes), 0) FROM transfers "
        "WHERE execution_id = ?1 AND status = 'completed') "
        "WHERE id = ?1;");
    stmt.bindInt64(1, executionId);
    stmt.run();
}

Transfer Ledger::beginTransfer(int64_t executionId, const std::string& sourcePath,
                               const std::string& destinationPath, uint64_t fileSize) {
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    requireOpenExecution(executionId);

    Statement existing(*db, std::string("SELECT ") + TRANSFER_COLUMNS +
                            " FROM transfers WHERE execution_id = ?1 AND source_path = ?2;");
    existing.bindInt64(1, executionId).bindText(2, sourcePath);
    if (existing.step()) {
        Transfer previous = readTransfer(existing);
        if (isFinished(previous.status)) {
            throw LedgerError(LedgerErrorCode::Conflict, "Transfer of " + sourcePath + " is already finished");
        }
        Statement retry(*db,
            "UPDATE transfers SET destination_path = ?2, file_size = ?3, status = 'in_progress', "
            "checksum = NULL, transferred_bytes = 0, retry_count = retry_count + 1, error_message = NULL, "
            "started_at = ?4, completed_at = NULL WHERE id = ?1;");
        retry.bindInt64(1, previous.id)
            .bindText(2, destinationPath)
            .bindInt64(3, static_cast<int64_t>(fileSize))
            .bindInt64(4, nowMillis());
        retry.run();
        auto transfer = loadTransfer(previous.id);
        // 失败的传输重新开始后不再计入失败数
        refreshCounters(executionId);
        tx.commit();
        return *transfer;
    }

    Statement insert(*db,
        "INSERT INTO transfers(execution_id, source_path, destination_path, file_size, status, started_at) "
        "VALUES(?1, ?2, ?3, ?4, 'in_progress', ?5);");
    insert.bindInt64(1, executionId)
        .bindText(2, sourcePath)
        .bindText(3, destinationPath)
        .bindInt64(4, static_cast<int64_t>(fileSize))
        .bindInt64(5, nowMillis());
    insert.run();
    auto transfer = loadTransfer(db->lastInsertId());
    tx.commit();
    return *transfer;
}

void Ledger::completeTransfer(int64_t transferId, TransferStatus status, const std::string& destinationPath,
                              const std::string& checksum, uint64_t transferredBytes) {
    if (!isFinished(status)) {
        throw LedgerError(LedgerErrorCode::Conflict, "Transfer can only complete as completed or skipped");
    }
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    auto transfer = loadTransfer(transferId);
    if (!transfer) {
        throw LedgerError(LedgerErrorCode::NotFound, "Transfer " + std::to_string(transferId) + " not found");
    }
    requireOpenExecution(transfer->executionId);

    Statement stmt(*db,
        "UPDATE transfers SET status = ?2, destination_path = ?3, checksum = ?4, transferred_bytes = ?5, "
        "error_message = NULL, completed_at = ?6 WHERE id = ?1;");
    stmt.bindInt64(1, transferId)
        .bindText(2, toString(status))
        .bindText(3, destinationPath);
    if (checksum.empty()) {
        stmt.bindNull(4);
    } else {
        stmt.bindText(4, checksum);
    }
    stmt.bindInt64(5, static_cast<int64_t>(transferredBytes))
        .bindInt64(6, nowMillis());
    stmt.run();
    refreshCounters(transfer->executionId);
    tx.commit();
}

void Ledger::failTransfer(int64_t transferId, const std::string& errorMessage) {
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    auto transfer = loadTransfer(transferId);
    if (!transfer) {
        throw LedgerError(LedgerErrorCode::NotFound, "Transfer " + std::to_string(transferId) + " not found");
    }
    requireOpenExecution(transfer->executionId);

    Statement stmt(*db,
        "UPDATE transfers SET status = 'failed', checksum = NULL, transferred_bytes = 0, "
        "error_message = ?2, completed_at = ?3 WHERE id = ?1;");
    stmt.bindInt64(1, transferId)
        .bindText(2, errorMessage)
        .bindInt64(3, nowMillis());
    stmt.run();
    refreshCounters(transfer->executionId);
    tx.commit();
}

void Ledger::recordCarriedTransfers(int64_t executionId, const std::vector<Transfer>& transfers) {
    std::lock_guard<std::mutex> lock(mutex);
    SqliteTransaction tx(*db);
    requireOpenExecution(executionId);

    int64_t now = nowMillis();
    Statement insert(*db,
        "INSERT INTO transfers(execution_id, source_path, destination_path, file_size, status, checksum, "
        "transferred_bytes, started_at, completed_at) VALUES(?1, ?2, ?3, ?4, 'skipped', ?5, 0, ?6, ?6) "
        "ON CONFLICT(execution_id, source_path) DO NOTHING;");
    for (const auto& transfer : transfers) {
        insert.reset();
        insert.bindInt64(1, executionId)
            .bindText(2, transfer.sourcePath)
            .bindText(3, transfer.destinationPath)
            .bindInt64(4, static_cast<int64_t>(transfer.fileSize))
            .bindText(5, transfer.checksum)
            .bindInt64(6, now);
        insert.run();
    }
    refreshCounters(executionId);
    tx.commit();
}

std::vector<Transfer> Ledger::listTransfers(int64_t executionId) {
    std::lock_guard<std::mutex> lock(mutex);
    Statement stmt(*db, std::string("SELECT ") + TRANSFER_COLUMNS +
                        " FROM transfers WHERE execution_id = ?1 ORDER BY id;");
    stmt.bindInt64(1, executionId);
    std::vector<Transfer> transfers;
    while (stmt.step()) {
        transfers.push_back(readTransfer(stmt));
    }
    return transfers;
}

std::set<std::string> Ledger::finishedSourcePaths(int64_t executionId) {
    std::lock_guard<std::mutex> lock(mutex);
    Statement stmt(*db, "SELECT source_path FROM transfers WHERE execution_id = ?1 "
                        "AND status IN ('completed','skipped');");
    stmt.bindInt64(1, executionId);
    std::set<std::string> paths;
    while (stmt.step()) {
        paths.insert(stmt.columnText(0));
    }
    return paths;
}

std::map<std::string, Transfer> Ledger::latestVerifiedTransfers(int64_t jobId, int64_t excludeExecutionId) {
    std::lock_guard<std::mutex> lock(mutex);
    // 带摘要的completed或skipped记录都是校验过的副本；按完成时间升序，后写入的覆盖前者
    Statement stmt(*db,
        "SELECT t.id, t.execution_id, t.source_path, t.destination_path, t.file_size, t.status, t.checksum, "
        "t.transferred_bytes, t.retry_count, t.error_message, t.started_at, t.completed_at "
        "FROM transfers t JOIN executions e ON e.id = t.execution_id "
        "WHERE e.job_id = ?1 AND e.id <> ?2 AND t.status IN ('completed','skipped') "
        "AND t.checksum IS NOT NULL AND t.checksum <> '' AND t.completed_at IS NOT NULL "
        "ORDER BY t.completed_at, t.id;");
    stmt.bindInt64(1, jobId).bindInt64(2, excludeExecutionId);
    std::map<std::string, Transfer> latest;
    while (stmt.step()) {
        Transfer transfer = readTransfer(stmt);
        latest[transfer.sourcePath] = transfer;
    }
    return latest;
}
