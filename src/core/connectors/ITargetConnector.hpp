#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include "../Types.hpp"

struct CopyResult {
    bool success = false;
    bool skipped = false;       // skip策略下目标已存在，未写入
    std::string finalPath;
    std::string checksum;       // 校验通过的源文件摘要
    uint64_t bytesWritten = 0;
    std::string errorMessage;
};

struct TargetFileInfo {
    std::string path;
    uint64_t size = 0;
    std::chrono::system_clock::time_point modifiedTime;
    bool isDirectory = false;
};

// 备份目标的能力接口
class ITargetConnector {
public:
    virtual ~ITargetConnector() = default;

    // config为作业中保存的目标配置（JSON文本）
    virtual bool initialize(const std::string& config) = 0;

    // 复制单个文件；不抛异常，失败信息放在CopyResult中
    virtual CopyResult copy(const std::string& source, const std::string& destination,
                            ConflictPolicy policy) = 0;

    virtual bool exists(const std::string& path) = 0;

    virtual bool createDirectory(const std::string& path) = 0;

    virtual std::optional<TargetFileInfo> getFileInfo(const std::string& path) = 0;

    virtual std::vector<TargetFileInfo> listFiles(const std::string& directory) = 0;

    virtual void cleanup() = 0;

    // 初始化后可用，作为目标路径的根
    virtual std::string getRootPath() const = 0;

    virtual std::string getTypeName() const = 0;
};
