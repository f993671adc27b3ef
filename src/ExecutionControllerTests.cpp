#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>
#include <string>
#include <vector>
#include "core/ExecutionController.hpp"
#include "core/ExecutionContext.hpp"
#include "core/connectors/ConnectorFactory.hpp"
#include "core/connectors/LocalTargetConnector.hpp"
#include "core/ledger/Ledger.hpp"
#include "utils/Hasher.hpp"
#include "TestHelpers.hpp"

using namespace std::chrono;

// 复制若干个文件后发出控制请求，模拟用户在执行中途操作
class InterruptingConnector : public LocalTargetConnector {
public:
    enum class Action { SUSPEND, STOP, CORRUPT };

    InterruptingConnector(ILogger* logger, ExecutionContext& context, Action action, int afterCopies)
        : LocalTargetConnector(logger), context(context), action(action), afterCopies(afterCopies) {}

    CopyResult copy(const std::string& source, const std::string& destination,
                    ConflictPolicy policy) override {
        CopyResult result = LocalTargetConnector::copy(source, destination, policy);
        if (++copies == afterCopies) {
            if (action == Action::SUSPEND) {
                context.requestSuspend();
            } else if (action == Action::STOP) {
                context.requestStop();
            }
        }
        return result;
    }

protected:
    bool writeTemporaryCopy(const std::string& source, const std::string& temporary,
                            std::string* error) override {
        if (!LocalTargetConnector::writeTemporaryCopy(source, temporary, error)) {
            return false;
        }
        if (action == Action::CORRUPT) {
            writeFile(temporary, "garbage");
        }
        return true;
    }

private:
    ExecutionContext& context;
    Action action;
    int afterCopies;
    int copies = 0;
};

class InterruptingFactory : public ConnectorFactory {
public:
    InterruptingFactory(ExecutionContext& context, InterruptingConnector::Action action, int afterCopies)
        : context(context), action(action), afterCopies(afterCopies) {}

    std::unique_ptr<ITargetConnector> create(const std::string& destinationType,
                                             ILogger* logger) const override {
        if (destinationType != "local") {
            return ConnectorFactory::create(destinationType, logger);
        }
        return std::make_unique<InterruptingConnector>(logger, context, action, afterCopies);
    }

private:
    ExecutionContext& context;
    InterruptingConnector::Action action;
    int afterCopies;
};

struct ProgressEvent {
    int processed;
    int total;
    std::string label;
};

class ExecutionControllerTest : public ::testing::Test {
protected:
    fs::path testDir = testDirectory("backupkeeper_controller_test");
    fs::path sourceDir = testDir / "source";
    fs::path backupDir = testDir / "backup";
    std::unique_ptr<Ledger> ledger;
    ExecutionContext context{milliseconds(10)};
    ConnectorFactory factory;
    EngineSettings settings;
    MockLogger mockLogger;
    std::vector<ProgressEvent> events;

    void SetUp() override {
        fs::remove_all(testDir);
        fs::create_directories(sourceDir);
        ledger = std::make_unique<Ledger>((testDir / "ledger.db").string());
        settings.pausePollInterval = milliseconds(10);
        allowAnyLogging(mockLogger);
    }

    void TearDown() override {
        ledger.reset();
        fs::remove_all(testDir);
    }

    void createSources(int count) {
        for (int i = 0; i < count; ++i) {
            writeFile(sourceDir / ("file" + std::to_string(i) + ".txt"), "content of file " + std::to_string(i));
        }
    }

    int64_t addJob(ConflictPolicy policy = ConflictPolicy::RENAME, const std::string& type = "local") {
        Job job;
        job.name = "docs";
        job.sources = {sourceDir.string()};
        job.destinationType = type;
        job.destinationConfig = "{\"local_path\": \"" + backupDir.string() + "\"}";
        job.conflictPolicy = policy;
        return ledger->createJob(job);
    }

    ExecutionOutcome runWith(const ConnectorFactory& with, int64_t jobId) {
        ExecutionController controller(*ledger, with, context, &mockLogger,
            [this](int processed, int total, const std::string& label) {
                events.push_back(ProgressEvent{processed, total, label});
            },
            settings);
        return controller.run(jobId);
    }

    ExecutionOutcome run(int64_t jobId) {
        return runWith(factory, jobId);
    }

    fs::path backed(const std::string& name) const {
        return backupDir / "docs" / name;
    }
};

TEST_F(ExecutionControllerTest, CopiesEveryFileAndCompletes) {
    createSources(4);
    int64_t jobId = addJob();

    ExecutionOutcome outcome = run(jobId);
    ASSERT_TRUE(outcome.success) << outcome.message;
    EXPECT_EQ(ExecutionStatus::COMPLETED, outcome.status);
    EXPECT_EQ("Backup completed: 4 successful, 0 failed", outcome.message);

    auto execution = ledger->getExecution(outcome.executionId);
    EXPECT_EQ(ExecutionStatus::COMPLETED, execution->status);
    EXPECT_EQ(4, execution->totalFiles);
    EXPECT_EQ(4, execution->processedFiles);
    EXPECT_EQ(0, execution->failedFiles);
    EXPECT_EQ(execution->totalBytes, execution->transferredBytes);
    EXPECT_TRUE(execution->completedAt.has_value());

    for (const auto& transfer : ledger->listTransfers(outcome.executionId)) {
        EXPECT_EQ(TransferStatus::COMPLETED, transfer.status);
        EXPECT_EQ(Hasher::digest(transfer.sourcePath), transfer.checksum);
        EXPECT_EQ(readFile(transfer.sourcePath), readFile(transfer.destinationPath));
    }
    EXPECT_EQ("content of file 2", readFile(backed("file2.txt")));
}

TEST_F(ExecutionControllerTest, ProgressIsMonotonicAndEndsComplete) {
    createSources(3);
    ExecutionOutcome outcome = run(addJob());
    ASSERT_TRUE(outcome.success);

    ASSERT_EQ(5u, events.size());
    EXPECT_EQ("Starting transfer", events.front().label);
    EXPECT_EQ("Backup completed", events.back().label);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GE(events[i].processed, events[i - 1].processed);
        EXPECT_EQ(3, events[i].total);
    }
    EXPECT_EQ(3, events.back().processed);
}

TEST_F(ExecutionControllerTest, IncludePatternsLimitTheBackup) {
    writeFile(sourceDir / "a.txt", "keep me");
    writeFile(sourceDir / "b.tmp", "leave me");
    Job job;
    job.name = "docs";
    job.sources = {sourceDir.string()};
    job.includePatterns = {"*.txt"};
    job.destinationConfig = "{\"local_path\": \"" + backupDir.string() + "\"}";
    int64_t jobId = ledger->createJob(job);

    ExecutionOutcome outcome = run(jobId);
    auto execution = ledger->getExecution(outcome.executionId);
    EXPECT_EQ(1, execution->totalFiles);
    EXPECT_EQ(1, execution->processedFiles);
    EXPECT_TRUE(fs::exists(backed("a.txt")));
    EXPECT_FALSE(fs::exists(backed("b.tmp")));
}

TEST_F(ExecutionControllerTest, SecondRunCarriesUnchangedFiles) {
    createSources(3);
    int64_t jobId = addJob();
    ExecutionOutcome first = run(jobId);
    ASSERT_TRUE(first.success);

    ExecutionOutcome second = run(jobId);
    ASSERT_TRUE(second.success);
    EXPECT_NE(first.executionId, second.executionId);
    EXPECT_EQ(ExecutionStatus::COMPLETED, second.status);

    auto execution = ledger->getExecution(second.executionId);
    EXPECT_EQ(3, execution->totalFiles);
    EXPECT_EQ(3, execution->processedFiles);
    EXPECT_EQ(0u, execution->transferredBytes);
    for (const auto& transfer : ledger->listTransfers(second.executionId)) {
        EXPECT_EQ(TransferStatus::SKIPPED, transfer.status);
        EXPECT_FALSE(transfer.checksum.empty());
    }
    // 没有产生重复副本
    EXPECT_FALSE(fs::exists(backed("file0_1.txt")));
}

TEST_F(ExecutionControllerTest, ModifiedFileIsCopiedAgain) {
    createSources(2);
    int64_t jobId = addJob(ConflictPolicy::OVERWRITE);
    ASSERT_TRUE(run(jobId).success);

    std::this_thread::sleep_for(milliseconds(20));
    writeFile(sourceDir / "file1.txt", "changed and longer content");

    ExecutionOutcome second = run(jobId);
    auto transfers = ledger->listTransfers(second.executionId);
    ASSERT_EQ(2u, transfers.size());
    int copied = 0;
    for (const auto& transfer : transfers) {
        copied += transfer.status == TransferStatus::COMPLETED ? 1 : 0;
    }
    EXPECT_EQ(1, copied);
    EXPECT_EQ("changed and longer content", readFile(backed("file1.txt")));
}

TEST_F(ExecutionControllerTest, SuspendedExecutionResumesWithoutDuplicates) {
    createSources(5);
    int64_t jobId = addJob();
    InterruptingFactory suspending(context, InterruptingConnector::Action::SUSPEND, 2);

    ExecutionOutcome first = runWith(suspending, jobId);
    EXPECT_TRUE(first.success);
    EXPECT_EQ(ExecutionStatus::PAUSED, first.status);
    auto paused = ledger->getExecution(first.executionId);
    EXPECT_EQ(ExecutionStatus::PAUSED, paused->status);
    EXPECT_EQ(2, paused->processedFiles);
    EXPECT_EQ(5, paused->totalFiles);

    context.reset();
    ExecutionOutcome second = run(jobId);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(first.executionId, second.executionId);
    EXPECT_EQ(ExecutionStatus::COMPLETED, second.status);

    auto execution = ledger->getExecution(second.executionId);
    EXPECT_EQ(5, execution->processedFiles);
    EXPECT_EQ(5, execution->totalFiles);
    EXPECT_TRUE(execution->resumedAt.has_value());
    EXPECT_EQ(5u, ledger->listTransfers(second.executionId).size());
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(fs::exists(backed("file" + std::to_string(i) + ".txt")));
        EXPECT_FALSE(fs::exists(backed("file" + std::to_string(i) + "_1.txt")));
    }
}

TEST_F(ExecutionControllerTest, SuspendDuringScanMeasuresTotalsOnResume) {
    createSources(3);
    int64_t jobId = addJob();

    context.requestSuspend();
    ExecutionOutcome first = run(jobId);
    EXPECT_EQ(ExecutionStatus::PAUSED, first.status);
    EXPECT_EQ(0, ledger->getExecution(first.executionId)->totalFiles);
    EXPECT_TRUE(events.empty());

    context.reset();
    ExecutionOutcome second = run(jobId);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(first.executionId, second.executionId);
    EXPECT_EQ(ExecutionStatus::COMPLETED, second.status);

    auto execution = ledger->getExecution(second.executionId);
    EXPECT_EQ(3, execution->totalFiles);
    EXPECT_EQ(3, execution->processedFiles);
    EXPECT_GT(execution->totalBytes, 0u);
    ASSERT_FALSE(events.empty());
    for (const auto& event : events) {
        EXPECT_EQ(3, event.total);
    }
}

TEST_F(ExecutionControllerTest, RecoveredExecutionCarriesUnchangedFiles) {
    createSources(3);
    int64_t jobId = addJob();
    ASSERT_TRUE(run(jobId).success);

    // 进程在新执行写入总数之前退出
    Execution interrupted = ledger->createExecution(jobId);
    ASSERT_EQ(1, ledger->recoverInterruptedExecutions());

    ExecutionOutcome outcome = run(jobId);
    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(interrupted.id, outcome.executionId);

    auto execution = ledger->getExecution(outcome.executionId);
    EXPECT_EQ(3, execution->totalFiles);
    EXPECT_EQ(3, execution->processedFiles);
    EXPECT_EQ(0u, execution->transferredBytes);
    for (const auto& transfer : ledger->listTransfers(outcome.executionId)) {
        EXPECT_EQ(TransferStatus::SKIPPED, transfer.status);
    }
    EXPECT_FALSE(fs::exists(backed("file0_1.txt")));
}

TEST_F(ExecutionControllerTest, CorruptCopiesFailTheirTransfers) {
    createSources(3);
    int64_t jobId = addJob();
    InterruptingFactory corrupting(context, InterruptingConnector::Action::CORRUPT, 0);

    ExecutionOutcome outcome = runWith(corrupting, jobId);
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(ExecutionStatus::COMPLETED_WITH_ERRORS, outcome.status);
    EXPECT_EQ("Backup completed: 0 successful, 3 failed", outcome.message);

    auto execution = ledger->getExecution(outcome.executionId);
    EXPECT_EQ(3, execution->failedFiles);
    EXPECT_EQ(0u, execution->transferredBytes);
    for (const auto& transfer : ledger->listTransfers(outcome.executionId)) {
        EXPECT_EQ(TransferStatus::FAILED, transfer.status);
        EXPECT_TRUE(transfer.checksum.empty());
        EXPECT_NE(transfer.errorMessage.find("Integrity check failed"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(backed("file0.txt")));
}

TEST_F(ExecutionControllerTest, RenameKeepsSameNamedSourcesApart) {
    writeFile(sourceDir / "one" / "a.txt", "from one");
    writeFile(sourceDir / "two" / "a.txt", "from two");
    int64_t jobId = addJob(ConflictPolicy::RENAME);

    ExecutionOutcome outcome = run(jobId);
    ASSERT_EQ(ExecutionStatus::COMPLETED, outcome.status);
    EXPECT_EQ("from one", readFile(backed("a.txt")));
    EXPECT_EQ("from two", readFile(backed("a_1.txt")));
}

TEST_F(ExecutionControllerTest, RenameAvoidsExistingBackup) {
    writeFile(sourceDir / "a.txt", "new");
    writeFile(backed("a.txt"), "old");
    ExecutionOutcome outcome = run(addJob(ConflictPolicy::RENAME));
    ASSERT_EQ(ExecutionStatus::COMPLETED, outcome.status);
    EXPECT_EQ("old", readFile(backed("a.txt")));
    EXPECT_EQ("new", readFile(backed("a_1.txt")));
}

TEST_F(ExecutionControllerTest, OverwriteReplacesExistingBackup) {
    writeFile(sourceDir / "a.txt", "new");
    writeFile(backed("a.txt"), "old");
    ExecutionOutcome outcome = run(addJob(ConflictPolicy::OVERWRITE));
    ASSERT_EQ(ExecutionStatus::COMPLETED, outcome.status);
    EXPECT_EQ("new", readFile(backed("a.txt")));
    EXPECT_FALSE(fs::exists(backed("a_1.txt")));
}

TEST_F(ExecutionControllerTest, SkipLeavesExistingBackup) {
    writeFile(sourceDir / "a.txt", "new");
    writeFile(backed("a.txt"), "old");
    ExecutionOutcome outcome = run(addJob(ConflictPolicy::SKIP));
    ASSERT_EQ(ExecutionStatus::COMPLETED, outcome.status);
    EXPECT_EQ("old", readFile(backed("a.txt")));

    auto transfers = ledger->listTransfers(outcome.executionId);
    ASSERT_EQ(1u, transfers.size());
    EXPECT_EQ(TransferStatus::SKIPPED, transfers[0].status);
    EXPECT_EQ(0, ledger->getExecution(outcome.executionId)->failedFiles);
}

TEST_F(ExecutionControllerTest, StopCancelsAndNextRunStartsFresh) {
    createSources(4);
    int64_t jobId = addJob();
    InterruptingFactory stopping(context, InterruptingConnector::Action::STOP, 1);

    ExecutionOutcome first = runWith(stopping, jobId);
    EXPECT_FALSE(first.success);
    EXPECT_EQ(ExecutionStatus::CANCELLED, first.status);
    auto cancelled = ledger->getExecution(first.executionId);
    EXPECT_EQ(ExecutionStatus::CANCELLED, cancelled->status);
    EXPECT_EQ(1, cancelled->processedFiles);
    EXPECT_TRUE(cancelled->completedAt.has_value());

    context.reset();
    ExecutionOutcome second = run(jobId);
    EXPECT_NE(first.executionId, second.executionId);
    EXPECT_EQ(ExecutionStatus::COMPLETED, second.status);
    EXPECT_EQ(4, ledger->getExecution(second.executionId)->processedFiles);
}

TEST_F(ExecutionControllerTest, EmptySourceCompletesWithNothingToDo) {
    ExecutionOutcome outcome = run(addJob());
    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(ExecutionStatus::COMPLETED, outcome.status);
    auto execution = ledger->getExecution(outcome.executionId);
    EXPECT_EQ(0, execution->totalFiles);
    EXPECT_EQ(0, execution->progressPercentage());
}

TEST_F(ExecutionControllerTest, UnknownJobIsRejected) {
    ExecutionOutcome outcome = run(999);
    EXPECT_TRUE(outcome.rejected);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(0, outcome.executionId);
}

TEST_F(ExecutionControllerTest, InactiveJobIsRejectedWithoutExecution) {
    int64_t jobId = addJob();
    ledger->softDeleteJob(jobId);
    ExecutionOutcome outcome = run(jobId);
    EXPECT_TRUE(outcome.rejected);
    EXPECT_TRUE(ledger->listExecutions(jobId).empty());
}

TEST_F(ExecutionControllerTest, UnusableDestinationIsRejected) {
    int64_t cloudJob = addJob(ConflictPolicy::RENAME, "gdrive");
    EXPECT_TRUE(run(cloudJob).rejected);
    EXPECT_TRUE(ledger->listExecutions(cloudJob).empty());

    Job job;
    job.name = "nowhere";
    job.sources = {sourceDir.string()};
    job.destinationType = "ftp";
    int64_t ftpJob = ledger->createJob(job);
    EXPECT_TRUE(run(ftpJob).rejected);
    EXPECT_TRUE(ledger->listExecutions(ftpJob).empty());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
