#include "SourceScanner.hpp"
#include "ExecutionContext.hpp"
#include "../utils/ILogger.hpp"
#include <algorithm>

SourceScanner::SourceScanner(ILogger* logger) : logger(logger) {}

ScanResult SourceScanner::scan(const std::vector<std::string>& sources, const PatternFilter& filter,
                               const ExecutionContext* context) const {
    ScanResult result;
    std::unordered_set<std::string> seen;

    for (const auto& source : sources) {
        if (context && context->shouldInterrupt()) {
            result.interrupted = true;
            return result;
        }

        std::error_code ec;
        fs::path path = fs::absolute(fs::path(source), ec);
        if (ec) {
            logger->warn("Source path cannot be resolved: " + source);
            result.skippedPaths++;
            continue;
        }
        path = path.lexically_normal();

        // 跟随符号链接判断类型
        fs::file_status status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            logger->warn("Source path does not exist: " + path.string());
            result.skippedPaths++;
            continue;
        }

        if (fs::is_regular_file(status)) {
            addFile(path, filter, result, seen);
        } else if (fs::is_directory(status)) {
            if (!scanDirectory(path, filter, context, result, seen)) {
                result.interrupted = true;
                return result;
            }
        } else {
            logger->warn("Source path is not a file or directory: " + path.string());
            result.skippedPaths++;
        }
    }

    logger->debug("Scan found " + std::to_string(result.files.size()) + " files");
    return result;
}

bool SourceScanner::scanDirectory(const fs::path& root, const PatternFilter& filter,
                                  const ExecutionContext* context, ScanResult& result,
                                  std::unordered_set<std::string>& seen) const {
    // 深度优先，显式栈；目录名逆序入栈以保证按名称顺序访问
    std::vector<fs::path> pending{root};

    while (!pending.empty()) {
        if (context && context->shouldInterrupt()) {
            return false;
        }

        fs::path dir = pending.back();
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            logger->warn("Cannot read directory " + dir.string() + ": " + ec.message());
            result.skippedPaths++;
            continue;
        }

        std::vector<fs::directory_entry> entries;
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            entries.push_back(*it);
        }
        if (ec) {
            logger->warn("Error while reading directory " + dir.string() + ": " + ec.message());
            result.skippedPaths++;
        }
        std::sort(entries.begin(), entries.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.path().filename() < b.path().filename();
                  });

        std::vector<fs::path> subdirectories;
        for (const auto& entry : entries) {
            std::error_code typeEc;
            // 不进入指向目录的符号链接，避免循环
            if (entry.is_symlink(typeEc)) {
                if (entry.is_regular_file(typeEc)) {
                    addFile(entry.path(), filter, result, seen);
                }
                continue;
            }
            if (entry.is_directory(typeEc)) {
                subdirectories.push_back(entry.path());
            } else if (entry.is_regular_file(typeEc)) {
                addFile(entry.path(), filter, result, seen);
            }
        }

        for (auto rit = subdirectories.rbegin(); rit != subdirectories.rend(); ++rit) {
            pending.push_back(*rit);
        }
    }
    return true;
}

void SourceScanner::addFile(const fs::path& path, const PatternFilter& filter, ScanResult& result,
                            std::unordered_set<std::string>& seen) const {
    std::string text = path.string();
    if (!filter.matchPath(text)) {
        return;
    }
    // 同一文件可能被多个源路径覆盖
    if (!seen.insert(text).second) {
        return;
    }
    result.files.push_back(text);
}
