#include "FileSystem.hpp"

namespace fs = std::filesystem;

static void setError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    // 使用symlink_status检查文件是否存在，不解析符号链接
    fs::file_status status = fs::symlink_status(path, ec);
    return !ec && status.type() != fs::file_type::not_found;
}

bool FileSystem::createDirectories(const std::string& path, std::string* error) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return true;
    }

    fs::create_directories(path, ec);
    if (ec) {
        setError(error, "Failed to create directories for " + path + " (" + ec.message() + ")");
        return false;
    }
    return true;
}

bool FileSystem::copyFile(const std::string& source, const std::string& destination, std::string* error) {
    fs::path destPath(destination);
    if (!destPath.parent_path().empty() && !createDirectories(destPath.parent_path().string(), error)) {
        return false;
    }

    std::error_code ec;
    // 源是指向普通文件的符号链接时复制其内容
    if (!fs::is_regular_file(source, ec)) {
        setError(error, "Source is not a regular file: " + source);
        return false;
    }

    // 目标是符号链接时先删除，避免写穿到链接目标
    if (fs::is_symlink(fs::symlink_status(destPath, ec))) {
        fs::remove(destPath, ec);
        if (ec) {
            setError(error, "Failed to remove existing symlink " + destination + " (" + ec.message() + ")");
            return false;
        }
    }

    if (!fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec)) {
        setError(error, "Failed to copy regular file from " + source + " to " + destination +
                        " (" + (ec ? ec.message() : std::string("unknown error")) + ")");
        return false;
    }

    // 保留修改时间，失败不影响复制结果
    std::error_code timeEc;
    auto mtime = fs::last_write_time(source, timeEc);
    if (!timeEc) {
        fs::last_write_time(destination, mtime, timeEc);
    }
    return true;
}

bool FileSystem::renameFile(const std::string& from, const std::string& to, std::string* error) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        setError(error, "Failed to rename " + from + " to " + to + " (" + ec.message() + ")");
        return false;
    }
    return true;
}

bool FileSystem::getFileSize(const std::string& filePath, uint64_t& size, std::string* error) {
    std::error_code ec;
    auto result = fs::file_size(filePath, ec);
    if (ec) {
        setError(error, ec.message());
        return false;
    }
    size = static_cast<uint64_t>(result);
    return true;
}

bool FileSystem::removeFile(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    return !ec;
}
