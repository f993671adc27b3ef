#include "File.hpp"
#include <sstream>
#include <ctime>

std::chrono::system_clock::time_point toSystemTime(fs::file_time_type fileTime) {
    // C++17没有clock_cast，借助两个时钟的当前时刻换算
    auto fileClockNow = fs::file_time_type::clock::now();
    auto sysClockNow = std::chrono::system_clock::now();
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        fileTime - fileClockNow + sysClockNow);
}

File::File() : fileType(fs::file_type::none), fileSize(0), sizeKnown(false) {}

File::File(const fs::path& path) : fileType(fs::file_type::none), fileSize(0), sizeKnown(false) {
    initialize(path);
}

void File::initialize(const fs::path& path) {
    this->filePath = path;
    this->fileName = path.filename().string();
    this->fileSize = 0;
    this->sizeKnown = false;

    // 使用symlink_status获取文件状态，不解析符号链接
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    if (ec) {
        this->fileType = fs::file_type::not_found;
        return;
    }
    this->fileType = status.type();

    if (fs::is_regular_file(status)) {
        std::error_code sizeEc;
        this->fileSize = fs::file_size(path, sizeEc);
        this->sizeKnown = !sizeEc;
        if (sizeEc) {
            this->fileSize = 0;
        }
    }

    if (fs::is_regular_file(status) || fs::is_directory(status)) {
        std::error_code timeEc;
        auto fileTime = fs::last_write_time(path, timeEc);
        if (!timeEc) {
            this->lastModifiedTime = toSystemTime(fileTime);
        }
    }
}

const fs::path& File::getFilePath() const {
    return this->filePath;
}

const std::string& File::getFileName() const {
    return this->fileName;
}

uint64_t File::getFileSize() const {
    return this->fileSize;
}

bool File::isSizeKnown() const {
    return this->sizeKnown;
}

fs::file_type File::getFileType() const {
    return this->fileType;
}

std::chrono::system_clock::time_point File::getLastModifiedTime() const {
    return this->lastModifiedTime;
}

bool File::exists() const {
    return fileType != fs::file_type::none && fileType != fs::file_type::not_found;
}

bool File::isDirectory() const {
    return fileType == fs::file_type::directory;
}

bool File::isRegularFile() const {
    return fileType == fs::file_type::regular;
}

bool File::isSymbolicLink() const {
    return fileType == fs::file_type::symlink;
}

std::string File::toString() const {
    std::stringstream ss;
    ss << "File: " << this->filePath.string() << "\n"
       << "Name: " << this->fileName << "\n"
       << "Size: " << this->fileSize << " bytes\n";

    if (this->isDirectory()) {
        ss << "Type: Directory" << std::endl;
    } else if (this->isRegularFile()) {
        ss << "Type: Regular File" << std::endl;
    } else if (this->isSymbolicLink()) {
        ss << "Type: Symbolic Link" << std::endl;
    } else {
        ss << "Type: Other" << std::endl;
    }

    auto modTime = std::chrono::system_clock::to_time_t(this->lastModifiedTime);
    ss << "Last Modified: " << std::ctime(&modTime);

    return ss.str();
}

bool File::operator==(const File& other) const {
    return this->filePath == other.filePath;
}

bool File::operator!=(const File& other) const {
    return !(*this == other);
}
