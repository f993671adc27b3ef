#pragma once
#include <string>
#include <set>
#include <mutex>
#include "ITargetConnector.hpp"

class ILogger;

// 本地文件系统目标
// 先写入同目录下的临时文件 ".<name>.tmp"，校验摘要一致后再原子重命名到最终路径
class LocalTargetConnector: public ITargetConnector {
public:
    LocalTargetConnector(ILogger* logger, size_t hashChunkSize = 8192, int renameMaxAttempts = 9999);
    ~LocalTargetConnector() override;

    // 配置需包含 "local_path"
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

    static std::string temporaryPathFor(const std::string& finalPath);

protected:
    // 把源文件内容写到临时路径
    virtual bool writeTemporaryCopy(const std::string& source, const std::string& temporary,
                                    std::string* error);

    ILogger* logger;

private:
    void discardTemporary(const std::string& temporary);

    std::string rootPath;
    size_t hashChunkSize;
    int renameMaxAttempts;
    bool initialized;

    std::mutex temporaryMutex;
    std::set<std::string> liveTemporaries;  // 尚未重命名或删除的临时文件
};
