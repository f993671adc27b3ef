#pragma once
#include <string>
#include <filesystem>
#include <chrono>
#include <cstdint>

namespace fs = std::filesystem;

// 扫描得到的源文件
class File {
private:
    fs::file_type fileType;

    fs::path filePath;
    std::string fileName;

    uint64_t fileSize;
    bool sizeKnown; // stat失败时为false
    std::chrono::system_clock::time_point lastModifiedTime;

public:
    File();
    explicit File(const fs::path& path);
    void initialize(const fs::path& path);

    // 基本属性访问
    const fs::path& getFilePath() const;
    const std::string& getFileName() const;
    uint64_t getFileSize() const;
    bool isSizeKnown() const;
    fs::file_type getFileType() const;
    std::chrono::system_clock::time_point getLastModifiedTime() const;

    // 文件类型判断
    bool exists() const;
    bool isDirectory() const;
    bool isRegularFile() const;
    bool isSymbolicLink() const;

    std::string toString() const;

    bool operator==(const File& other) const;
    bool operator!=(const File& other) const;
};

// file_time_type 转换为 system_clock
std::chrono::system_clock::time_point toSystemTime(fs::file_time_type fileTime);
