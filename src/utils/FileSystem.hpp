#pragma once
#include <string>
#include <filesystem>
#include <chrono>
#include <cstdint>
#include <system_error>

namespace fs = std::filesystem;

class FileSystem {
public:
    // 检查文件或目录是否存在（不解析符号链接）
    static bool exists(const std::string& path);

    // 创建目录（包括父目录），已存在视为成功
    static bool createDirectories(const std::string& path, std::string* error = nullptr);

    // 复制普通文件内容到目标路径（覆盖），并保留修改时间
    static bool copyFile(const std::string& source, const std::string& destination, std::string* error = nullptr);

    // 原子重命名，目标已存在时被替换
    static bool renameFile(const std::string& from, const std::string& to, std::string* error = nullptr);

    // 获取文件大小
    static bool getFileSize(const std::string& filePath, uint64_t& size, std::string* error = nullptr);


    // 删除单个文件，不存在也返回true
    static bool removeFile(const std::string& path);
};
