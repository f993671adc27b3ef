#include "CloudTargetConnector.hpp"
#include "../../utils/ILogger.hpp"

CloudTargetConnector::CloudTargetConnector(ILogger* logger) : logger(logger) {}

bool CloudTargetConnector::initialize(const std::string& config) {
    (void)config;
    logger->warn("Google Drive target is not implemented");
    return false;
}

CopyResult CloudTargetConnector::copy(const std::string& source, const std::string& destination,
                                      ConflictPolicy policy) {
    (void)destination;
    (void)policy;
    CopyResult result;
    result.errorMessage = "Google Drive upload not implemented: " + source;
    logger->warn(result.errorMessage);
    return result;
}

bool CloudTargetConnector::exists(const std::string& path) {
    logger->warn("Google Drive file check not implemented: " + path);
    return false;
}

bool CloudTargetConnector::createDirectory(const std::string& path) {
    logger->warn("Google Drive folder creation not implemented: " + path);
    return false;
}

std::optional<TargetFileInfo> CloudTargetConnector::getFileInfo(const std::string& path) {
    logger->warn("Google Drive file info not implemented: " + path);
    return std::nullopt;
}

std::vector<TargetFileInfo> CloudTargetConnector::listFiles(const std::string& directory) {
    logger->warn("Google Drive file listing not implemented: " + directory);
    return {};
}

void CloudTargetConnector::cleanup() {}

std::string CloudTargetConnector::getRootPath() const {
    return "";
}

std::string CloudTargetConnector::getTypeName() const {
    return "gdrive";
}
