#include "FileLogger.hpp"
#include <filesystem>
#include <algorithm>
#include <vector>
#include <chrono>
#include <ctime>
#include <iostream>

namespace fs = std::filesystem;

static std::string fileTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm);
    return buffer;
}

FileLogger::FileLogger(const std::string& logDirectory, int maxLogFiles, LogLevel level)
    : level(level) {
    std::error_code ec;
    fs::create_directories(logDirectory, ec);
    if (ec) {
        std::cerr << "Error: Failed to create log directory " << logDirectory << " (" << ec.message() << ")" << std::endl;
        return;
    }

    logFilePath = (fs::path(logDirectory) / ("backup_" + fileTimestamp() + ".log")).string();
    stream.open(logFilePath, std::ios::app);
    if (!stream) {
        std::cerr << "Error: Failed to open log file " << logFilePath << std::endl;
        return;
    }

    cleanupOldLogs(logDirectory, maxLogFiles);
}

FileLogger::~FileLogger() {
    if (stream.is_open()) {
        stream.flush();
    }
}

bool FileLogger::isOpen() const {
    return stream.is_open();
}

const std::string& FileLogger::getLogFilePath() const {
    return logFilePath;
}

void FileLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void FileLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void FileLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void FileLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void FileLogger::setLogLevel(LogLevel newLevel) {
    level = newLevel;
}

LogLevel FileLogger::getLogLevel() const {
    return level;
}

void FileLogger::log(LogLevel messageLevel, const std::string& message) {
    if (messageLevel < level.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(outputMutex);
    if (!stream.is_open()) {
        return;
    }
    stream << "[" << currentTimestamp() << "] [" << logLevelName(messageLevel) << "] " << message << "\n";
    stream.flush();
}

int FileLogger::cleanupOldLogs(const std::string& logDirectory, int maxLogFiles) {
    std::error_code ec;
    std::vector<std::pair<fs::file_time_type, fs::path>> logs;
    for (const auto& entry : fs::directory_iterator(logDirectory, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("backup_", 0) != 0 || entry.path().extension() != ".log") {
            continue;
        }
        std::error_code timeEc;
        auto mtime = fs::last_write_time(entry.path(), timeEc);
        if (!timeEc) {
            logs.emplace_back(mtime, entry.path());
        }
    }
    if (ec || maxLogFiles < 0 || static_cast<int>(logs.size()) <= maxLogFiles) {
        return 0;
    }

    // 按修改时间从新到旧排序，同一秒内按文件名
    std::sort(logs.begin(), logs.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second.filename().string() > b.second.filename().string();
    });

    int removed = 0;
    for (size_t i = static_cast<size_t>(maxLogFiles); i < logs.size(); ++i) {
        std::error_code removeEc;
        if (fs::remove(logs[i].second, removeEc)) {
            ++removed;
        }
    }
    return removed;
}
