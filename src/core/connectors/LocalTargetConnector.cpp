#include "LocalTargetConnector.hpp"
#include "../ConflictResolver.hpp"
#include "../models/File.hpp"
#include "../../utils/FileSystem.hpp"
#include "../../utils/Hasher.hpp"
#include "../../utils/ILogger.hpp"
#include <json/json.h>
#include <sstream>
#include <stdexcept>

LocalTargetConnector::LocalTargetConnector(ILogger* logger, size_t hashChunkSize, int renameMaxAttempts)
    : logger(logger), hashChunkSize(hashChunkSize), renameMaxAttempts(renameMaxAttempts), initialized(false) {}

LocalTargetConnector::~LocalTargetConnector() {
    cleanup();
}

bool LocalTargetConnector::initialize(const std::string& config) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream in(config.empty() ? std::string("{}") : config);
    if (!Json::parseFromStream(builder, in, &root, &errors) || !root.isObject()) {
        logger->error("Invalid local target config: " + errors);
        return false;
    }

    std::string localPath = root.get("local_path", "").asString();
    if (localPath.empty()) {
        logger->error("No local path specified in target config");
        return false;
    }

    std::string error;
    if (!FileSystem::createDirectories(localPath, &error)) {
        logger->error("Failed to initialize local target: " + error);
        return false;
    }

    rootPath = localPath;
    initialized = true;
    logger->info("Local target initialized: " + rootPath);
    return true;
}

std::string LocalTargetConnector::temporaryPathFor(const std::string& finalPath) {
    fs::path path(finalPath);
    return (path.parent_path() / ("." + path.filename().string() + ".tmp")).string();
}

bool LocalTargetConnector::writeTemporaryCopy(const std::string& source, const std::string& temporary,
                                              std::string* error) {
    return FileSystem::copyFile(source, temporary, error);
}

void LocalTargetConnector::discardTemporary(const std::string& temporary) {
    if (!FileSystem::removeFile(temporary)) {
        logger->warn("Failed to remove temporary file: " + temporary);
        return;
    }
    std::lock_guard<std::mutex> lock(temporaryMutex);
    liveTemporaries.erase(temporary);
}

CopyResult LocalTargetConnector::copy(const std::string& source, const std::string& destination,
                                      ConflictPolicy policy) {
    CopyResult result;
    if (!initialized) {
        result.errorMessage = "Local target is not initialized";
        return result;
    }

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        result.errorMessage = "Source file does not exist: " + source;
        logger->error(result.errorMessage);
        return result;
    }

    std::string error;
    fs::path target(destination);
    if (!FileSystem::createDirectories(target.parent_path().string(), &error)) {
        result.errorMessage = error;
        logger->error(error);
        return result;
    }

    // 复制前再次检查冲突，计划之后目标可能已变化
    ConflictResolution resolution = resolveConflict(
        destination, policy,
        [](const std::string& path) { return FileSystem::exists(path); },
        renameMaxAttempts);
    if (resolution.downgraded) {
        logger->warn("Too many conflicts for " + destination + ", using overwrite");
    }
    if (resolution.skip) {
        logger->info("Skipped existing file: " + destination);
        result.success = true;
        result.skipped = true;
        result.finalPath = destination;
        return result;
    }

    const std::string finalPath = resolution.path;
    const std::string temporary = temporaryPathFor(finalPath);
    {
        std::lock_guard<std::mutex> lock(temporaryMutex);
        liveTemporaries.insert(temporary);
    }

    if (!writeTemporaryCopy(source, temporary, &error)) {
        result.errorMessage = error.empty() ? "Failed to copy " + source : error;
        logger->error(result.errorMessage);
        discardTemporary(temporary);
        return result;
    }

    // 重命名前校验，任何摘要错误都按校验失败处理
    std::string sourceDigest;
    std::string copyDigest;
    try {
        sourceDigest = Hasher::digest(source, hashChunkSize);
        copyDigest = Hasher::digest(temporary, hashChunkSize);
    } catch (const std::runtime_error& e) {
        result.errorMessage = std::string("Integrity check failed: ") + e.what();
        logger->error(result.errorMessage);
        discardTemporary(temporary);
        return result;
    }
    if (sourceDigest != copyDigest) {
        result.errorMessage = "Integrity check failed for " + source;
        logger->error(result.errorMessage);
        discardTemporary(temporary);
        return result;
    }

    if (!FileSystem::renameFile(temporary, finalPath, &error)) {
        result.errorMessage = error;
        logger->error(error);
        discardTemporary(temporary);
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(temporaryMutex);
        liveTemporaries.erase(temporary);
    }

    uint64_t size = 0;
    FileSystem::getFileSize(finalPath, size);

    result.success = true;
    result.finalPath = finalPath;
    result.checksum = sourceDigest;
    result.bytesWritten = size;
    logger->debug("Successfully copied: " + source + " -> " + finalPath);
    return result;
}

bool LocalTargetConnector::exists(const std::string& path) {
    return FileSystem::exists(path);
}

bool LocalTargetConnector::createDirectory(const std::string& path) {
    std::string error;
    if (!FileSystem::createDirectories(path, &error)) {
        logger->error(error);
        return false;
    }
    return true;
}

std::optional<TargetFileInfo> LocalTargetConnector::getFileInfo(const std::string& path) {
    File file{fs::path(path)};
    if (!file.exists()) {
        return std::nullopt;
    }
    TargetFileInfo info;
    info.path = path;
    info.size = file.getFileSize();
    info.modifiedTime = file.getLastModifiedTime();
    info.isDirectory = file.isDirectory();
    return info;
}

std::vector<TargetFileInfo> LocalTargetConnector::listFiles(const std::string& directory) {
    std::vector<TargetFileInfo> entries;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return entries;
    }

    fs::directory_iterator it(directory, ec);
    if (ec) {
        logger->error("Failed to list files in " + directory + ": " + ec.message());
        return entries;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        File file(it->path());
        if (!file.exists()) {
            logger->warn("Could not get info for " + it->path().string());
            continue;
        }
        TargetFileInfo info;
        info.path = it->path().string();
        info.size = file.isDirectory() ? 0 : file.getFileSize();
        info.modifiedTime = file.getLastModifiedTime();
        info.isDirectory = file.isDirectory();
        entries.push_back(info);
    }
    if (ec) {
        logger->warn("Listing of " + directory + " stopped early: " + ec.message());
    }
    return entries;
}

void LocalTargetConnector::cleanup() {
    std::set<std::string> remaining;
    {
        std::lock_guard<std::mutex> lock(temporaryMutex);
        remaining.swap(liveTemporaries);
    }
    for (const auto& temporary : remaining) {
        if (!FileSystem::removeFile(temporary)) {
            logger->warn("Failed to clean up temporary file: " + temporary);
        }
    }
}

std::string LocalTargetConnector::getRootPath() const {
    return rootPath;
}

std::string LocalTargetConnector::getTypeName() const {
    return "local";
}
