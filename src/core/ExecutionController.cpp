#include "ExecutionController.hpp"
#include "ExecutionContext.hpp"
#include "Filter.hpp"
#include "SourceScanner.hpp"
#include "TransferPlanner.hpp"
#include "connectors/ConnectorFactory.hpp"
#include "ledger/Ledger.hpp"
#include "../utils/ILogger.hpp"
#include <exception>

ExecutionController::ExecutionController(Ledger& ledger, const ConnectorFactory& factory,
                                         ExecutionContext& context, ILogger* logger,
                                         ProgressSink progress, const EngineSettings& settings)
    : ledger(ledger), factory(factory), context(context), logger(logger),
      progress(std::move(progress)), settings(settings) {}

bool ExecutionController::prepare(int64_t jobId, Job& job, std::unique_ptr<ITargetConnector>& connector,
                                  std::string& error) {
    std::optional<Job> loaded;
    try {
        loaded = ledger.getJob(jobId);
    } catch (const LedgerError& e) {
        error = std::string("Failed to load job: ") + e.what();
        logger->error(error);
        return false;
    }
    if (!loaded) {
        error = "Job " + std::to_string(jobId) + " not found";
        logger->error(error);
        return false;
    }
    if (!loaded->active) {
        error = "Job " + loaded->name + " is not active";
        logger->error(error);
        return false;
    }

    std::unique_ptr<ITargetConnector> created = factory.create(loaded->destinationType, logger);
    if (!created) {
        error = "Unsupported destination type: " + loaded->destinationType;
        logger->error(error);
        return false;
    }
    if (!created->initialize(loaded->destinationConfig)) {
        error = "Failed to initialize " + loaded->destinationType + " destination";
        logger->error(error);
        return false;
    }

    job = *loaded;
    connector = std::move(created);
    return true;
}

ExecutionOutcome ExecutionController::run(int64_t jobId) {
    Job job;
    std::unique_ptr<ITargetConnector> connector;
    std::string error;
    if (!prepare(jobId, job, connector, error)) {
        ExecutionOutcome outcome;
        outcome.rejected = true;
        outcome.message = error;
        return outcome;
    }
    return run(job, *connector);
}

ExecutionOutcome ExecutionController::run(const Job& job, ITargetConnector& connector) {
    ExecutionOutcome outcome;
    const int64_t jobId = job.id;
    int64_t executionId = 0;
    try {
        bool needsTotals = true;
        std::optional<Execution> paused = ledger.findPausedExecution(jobId);
        if (paused) {
            executionId = paused->id;
            ledger.markExecutionResumed(executionId);
            // 在扫描完成前被挂起（或进程中断）的执行还没有总数和沿用记录
            needsTotals = paused->totalFiles == 0 && ledger.listTransfers(executionId).empty();
            logger->info("Resuming from previous paused execution " + std::to_string(executionId));
        } else {
            executionId = ledger.createExecution(jobId).id;
            logger->info("Starting backup job: " + job.name);
        }
        outcome.executionId = executionId;

        PatternFilter filter(job.includePatterns, job.excludePatterns);
        SourceScanner scanner(logger);
        ScanResult scan;
        while (true) {
            logger->info("Scanning source files...");
            scan = scanner.scan(job.sources, filter, &context);
            if (!scan.interrupted) {
                break;
            }
            if (checkpoint(executionId, outcome)) {
                connector.cleanup();
                return outcome;
            }
        }

        TransferPlanner planner(logger, settings.renameMaxAttempts);
        if (needsTotals) {
            PlanTotals totals = planner.measure(scan.files);
            ledger.setExecutionTotals(executionId, totals.fileCount, totals.totalBytes);

            std::vector<Transfer> carried =
                planner.carryOver(scan.files, ledger.latestVerifiedTransfers(jobId, executionId), connector);
            if (!carried.empty()) {
                ledger.recordCarriedTransfers(executionId, carried);
                logger->info(std::to_string(carried.size()) + " files unchanged since last backup");
            }
        }

        std::set<std::string> finished = ledger.finishedSourcePaths(executionId);
        TransferPlan plan = planner.plan(job, connector.getRootPath(), scan.files, finished, connector);
        logger->info("Found " + std::to_string(scan.files.size()) + " total files, " +
                     std::to_string(plan.items.size()) + " remaining to process");

        emitProgress(executionId, "Starting transfer");

        for (const auto& item : plan.items) {
            // 每个文件开始前检查，文件复制过程中不中断
            if (checkpoint(executionId, outcome)) {
                connector.cleanup();
                return outcome;
            }
            transferOne(job, executionId, item, connector);
            emitProgress(executionId, fs::path(item.sourcePath).filename().string());
        }

        finalize(executionId, outcome);
    } catch (const std::exception& e) {
        outcome.success = false;
        outcome.status = ExecutionStatus::FAILED;
        outcome.message = std::string("Backup failed: ") + e.what();
        logger->error(outcome.message);
        outcome.rejected = executionId == 0;
        if (executionId != 0) {
            try {
                ledger.finishExecution(executionId, ExecutionStatus::FAILED, e.what());
            } catch (const LedgerError& inner) {
                logger->error(std::string("Failed to record execution failure: ") + inner.what());
            }
        }
    }

    connector.cleanup();
    return outcome;
}

bool ExecutionController::checkpoint(int64_t executionId, ExecutionOutcome& outcome) {
    ControlSignal signal = context.poll();
    if (signal == ControlSignal::CONTINUE) {
        return false;
    }
    if (signal == ControlSignal::STOP) {
        cancel(executionId, outcome);
        return true;
    }

    ledger.markExecutionPaused(executionId);
    logger->info("Backup paused and saved");

    signal = context.waitWhilePaused();
    if (signal == ControlSignal::STOP) {
        cancel(executionId, outcome);
        return true;
    }
    if (signal == ControlSignal::PAUSE) {
        // 执行线程退出，记录保持paused，下次启动该作业时继续
        outcome.success = true;
        outcome.status = ExecutionStatus::PAUSED;
        outcome.message = "Backup paused";
        return true;
    }

    ledger.markExecutionResumed(executionId);
    logger->info("Backup resumed");
    return false;
}

void ExecutionController::cancel(int64_t executionId, ExecutionOutcome& outcome) {
    ledger.finishExecution(executionId, ExecutionStatus::CANCELLED, "Backup cancelled by user");
    logger->info("Backup cancelled by user");
    outcome.success = false;
    outcome.status = ExecutionStatus::CANCELLED;
    outcome.message = "Backup cancelled";
}

void ExecutionController::finalize(int64_t executionId, ExecutionOutcome& outcome) {
    std::optional<Execution> execution = ledger.getExecution(executionId);
    if (!execution) {
        throw LedgerError(LedgerErrorCode::NotFound, "Execution " + std::to_string(executionId) + " disappeared");
    }

    int successful = execution->processedFiles - execution->failedFiles;
    ExecutionStatus status = execution->failedFiles == 0 ? ExecutionStatus::COMPLETED
                                                          : ExecutionStatus::COMPLETED_WITH_ERRORS;
    ledger.finishExecution(executionId, status);

    outcome.success = true;
    outcome.status = status;
    outcome.message = "Backup completed: " + std::to_string(successful) + " successful, " +
                      std::to_string(execution->failedFiles) + " failed";
    if (status == ExecutionStatus::COMPLETED) {
        logger->info(outcome.message);
    } else {
        logger->warn(outcome.message);
    }
    if (progress) {
        progress(execution->processedFiles, execution->totalFiles, "Backup completed");
    }
}

void ExecutionController::transferOne(const Job& job, int64_t executionId, const TransferItem& item,
                                      ITargetConnector& connector) {
    std::string name = fs::path(item.sourcePath).filename().string();
    Transfer transfer = ledger.beginTransfer(executionId, item.sourcePath, item.destinationPath, item.fileSize);
    if (transfer.retryCount > 0) {
        logger->debug("Retrying " + name + " (attempt " + std::to_string(transfer.retryCount + 1) + ")");
    }

    CopyResult result = connector.copy(item.sourcePath, item.destinationPath, job.conflictPolicy);

    if (!result.success) {
        std::string error = result.errorMessage.empty() ? "Copy operation failed" : result.errorMessage;
        ledger.failTransfer(transfer.id, error);
        logger->warn("Failed to copy: " + name);
        return;
    }

    if (result.skipped) {
        ledger.completeTransfer(transfer.id, TransferStatus::SKIPPED, result.finalPath, result.checksum, 0);
        logger->info("Skipped existing file: " + name);
        return;
    }

    ledger.completeTransfer(transfer.id, TransferStatus::COMPLETED, result.finalPath, result.checksum,
                            item.fileSize);
    logger->info("Successfully copied: " + name);
}

void ExecutionController::emitProgress(int64_t executionId, const std::string& label) {
    if (!progress) {
        return;
    }
    std::optional<Execution> execution = ledger.getExecution(executionId);
    if (execution) {
        progress(execution->processedFiles, execution->totalFiles, label);
    }
}
