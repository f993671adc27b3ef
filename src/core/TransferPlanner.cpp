#include "TransferPlanner.hpp"
#include "ConflictResolver.hpp"
#include "connectors/ITargetConnector.hpp"
#include "models/File.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/ILogger.hpp"
#include <unordered_set>

TransferPlanner::TransferPlanner(ILogger* logger, int renameMaxAttempts)
    : logger(logger), renameMaxAttempts(renameMaxAttempts) {}

std::string TransferPlanner::destinationFor(const std::string& destinationRoot, const std::string& jobName,
                                            const std::string& sourcePath) {
    return (fs::path(destinationRoot) / jobName / fs::path(sourcePath).filename()).string();
}

TransferPlan TransferPlanner::plan(const Job& job, const std::string& destinationRoot,
                                   const std::vector<std::string>& files,
                                   const std::set<std::string>& finishedSources,
                                   ITargetConnector& connector) const {
    TransferPlan result;
    // 本次计划中已占用的目标路径
    std::unordered_set<std::string> claimed;

    for (const auto& source : files) {
        if (finishedSources.count(source)) {
            continue;
        }

        uint64_t size = 0;
        std::string error;
        if (!FileSystem::getFileSize(source, size, &error)) {
            logger->warn("Cannot read size of " + source + ", skipping: " + error);
            result.omittedFiles++;
            continue;
        }

        std::string target = destinationFor(destinationRoot, job.name, source);
        if (job.conflictPolicy == ConflictPolicy::RENAME) {
            ConflictResolution resolution = resolveConflict(
                target, ConflictPolicy::RENAME,
                [&](const std::string& path) {
                    return claimed.count(path) > 0 || connector.exists(path);
                },
                renameMaxAttempts);
            if (resolution.downgraded) {
                logger->warn("Too many conflicts for " + target + ", using overwrite");
                result.downgradedRenames++;
            }
            target = resolution.path;
        }
        // overwrite与skip在复制时由连接器处理

        claimed.insert(target);
        result.items.push_back(TransferItem{source, target, size});
    }

    logger->debug("Planned " + std::to_string(result.items.size()) + " transfers for job " + job.name);
    return result;
}

PlanTotals TransferPlanner::measure(const std::vector<std::string>& files) const {
    PlanTotals totals;
    for (const auto& source : files) {
        uint64_t size = 0;
        if (FileSystem::getFileSize(source, size)) {
            totals.fileCount++;
            totals.totalBytes += size;
        } else {
            logger->debug("Could not get size for " + source);
        }
    }
    return totals;
}

std::vector<Transfer> TransferPlanner::carryOver(const std::vector<std::string>& files,
                                                 const std::map<std::string, Transfer>& previous,
                                                 ITargetConnector& connector) const {
    std::vector<Transfer> carried;
    for (const auto& source : files) {
        auto it = previous.find(source);
        if (it == previous.end() || !it->second.completedAt) {
            continue;
        }
        const Transfer& last = it->second;

        File file{fs::path(source)};
        if (!file.isSizeKnown() || file.getFileSize() != last.fileSize) {
            continue;
        }
        if (file.getLastModifiedTime() > *last.completedAt) {
            continue;
        }
        if (last.destinationPath.empty() || !connector.exists(last.destinationPath)) {
            continue;
        }

        Transfer transfer;
        transfer.sourcePath = source;
        transfer.destinationPath = last.destinationPath;
        transfer.fileSize = last.fileSize;
        transfer.status = TransferStatus::SKIPPED;
        transfer.checksum = last.checksum;
        carried.push_back(transfer);
    }
    return carried;
}
