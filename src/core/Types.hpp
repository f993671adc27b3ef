#pragma once
#include <string>

// 执行状态，字符串形式直接写入账本
enum class ExecutionStatus {
    PENDING,
    RUNNING,
    PAUSED,
    COMPLETED,
    COMPLETED_WITH_ERRORS,
    FAILED,
    CANCELLED
};

enum class TransferStatus {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED,
    SKIPPED
};

// 目标路径冲突策略
enum class ConflictPolicy {
    RENAME,
    OVERWRITE,
    SKIP
};

inline std::string toString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::PENDING: return "pending";
        case ExecutionStatus::RUNNING: return "running";
        case ExecutionStatus::PAUSED: return "paused";
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::COMPLETED_WITH_ERRORS: return "completed_with_errors";
        case ExecutionStatus::FAILED: return "failed";
        case ExecutionStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

inline std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING: return "pending";
        case TransferStatus::IN_PROGRESS: return "in_progress";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::SKIPPED: return "skipped";
        default: return "unknown";
    }
}

inline std::string toString(ConflictPolicy policy) {
    switch (policy) {
        case ConflictPolicy::RENAME: return "rename";
        case ConflictPolicy::OVERWRITE: return "overwrite";
        case ConflictPolicy::SKIP: return "skip";
        default: return "unknown";
    }
}

inline bool parseExecutionStatus(const std::string& text, ExecutionStatus& status) {
    static const ExecutionStatus all[] = {
        ExecutionStatus::PENDING, ExecutionStatus::RUNNING, ExecutionStatus::PAUSED,
        ExecutionStatus::COMPLETED, ExecutionStatus::COMPLETED_WITH_ERRORS,
        ExecutionStatus::FAILED, ExecutionStatus::CANCELLED
    };
    for (ExecutionStatus candidate : all) {
        if (toString(candidate) == text) {
            status = candidate;
            return true;
        }
    }
    return false;
}

inline bool parseTransferStatus(const std::string& text, TransferStatus& status) {
    static const TransferStatus all[] = {
        TransferStatus::PENDING, TransferStatus::IN_PROGRESS, TransferStatus::COMPLETED,
        TransferStatus::FAILED, TransferStatus::SKIPPED
    };
    for (TransferStatus candidate : all) {
        if (toString(candidate) == text) {
            status = candidate;
            return true;
        }
    }
    return false;
}

inline bool parseConflictPolicy(const std::string& text, ConflictPolicy& policy) {
    if (text == "rename") {
        policy = ConflictPolicy::RENAME;
    } else if (text == "overwrite") {
        policy = ConflictPolicy::OVERWRITE;
    } else if (text == "skip") {
        policy = ConflictPolicy::SKIP;
    } else {
        return false;
    }
    return true;
}

// 终态的执行记录不可再修改
inline bool isTerminal(ExecutionStatus status) {
    return status == ExecutionStatus::COMPLETED ||
           status == ExecutionStatus::COMPLETED_WITH_ERRORS ||
           status == ExecutionStatus::FAILED ||
           status == ExecutionStatus::CANCELLED;
}

// 已完成或按策略跳过的传输在恢复时不再重复
inline bool isFinished(TransferStatus status) {
    return status == TransferStatus::COMPLETED || status == TransferStatus::SKIPPED;
}
