#include "ConnectorFactory.hpp"
#include "LocalTargetConnector.hpp"
#include "CloudTargetConnector.hpp"

ConnectorFactory::ConnectorFactory(size_t hashChunkSize, int renameMaxAttempts)
    : hashChunkSize(hashChunkSize), renameMaxAttempts(renameMaxAttempts) {}

std::unique_ptr<ITargetConnector> ConnectorFactory::create(const std::string& destinationType,
                                                           ILogger* logger) const {
    if (destinationType == "local") {
        return std::make_unique<LocalTargetConnector>(logger, hashChunkSize, renameMaxAttempts);
    }
    if (destinationType == "gdrive") {
        return std::make_unique<CloudTargetConnector>(logger);
    }
    return nullptr;
}
