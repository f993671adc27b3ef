#pragma once
#include "ITargetConnector.hpp"

class ILogger;

// 云存储目标（gdrive），尚未实现：初始化总是失败，作业不会在该目标上运行
class CloudTargetConnector: public ITargetConnector {
public:
    explicit CloudTargetConnector(ILogger* logger);

    bool initialize(const std::string& config) override;
    CopyResult copy(const std::string& source, const std::string& destination,
                    ConflictPolicy policy) override;
    bool exists(const std::string& path) override;
    bool createDirectory(const std::string& path) override;
    std::optional<TargetFileInfo> getFileInfo(const std::string& path) override;
    std::vector<TargetFileInfo> listFiles(const std::string& directory) override;
    void cleanup() override;
    std::string getRootPath() const override;
    std::string getTypeName() const override;

private:
    ILogger* logger;
};
