#pragma once
#include <string>
#include <vector>
#include <unordered_set>
#include "Filter.hpp"

class ILogger;
class ExecutionContext;

struct ScanResult {
    std::vector<std::string> files;  // 绝对路径，按源顺序和目录内名称排序
    bool interrupted = false;        // 收到暂停或停止请求而提前返回
    int skippedPaths = 0;            // 不存在或不可读而跳过的路径数
};

// 遍历作业的源路径并按通配符过滤
class SourceScanner {
public:
    explicit SourceScanner(ILogger* logger);

    // 每进入一个目录前检查context，context可为空
    ScanResult scan(const std::vector<std::string>& sources, const PatternFilter& filter,
                    const ExecutionContext* context = nullptr) const;

private:
    bool scanDirectory(const fs::path& root, const PatternFilter& filter,
                       const ExecutionContext* context, ScanResult& result,
                       std::unordered_set<std::string>& seen) const;
    void addFile(const fs::path& path, const PatternFilter& filter, ScanResult& result,
                 std::unordered_set<std::string>& seen) const;

    ILogger* logger;
};
