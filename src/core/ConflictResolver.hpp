#pragma once
#include <string>
#include <functional>
#include "Types.hpp"

struct ConflictResolution {
    std::string path;          // 最终写入路径
    bool skip = false;         // skip策略下目标已存在
    bool downgraded = false;   // rename次数耗尽，退化为覆盖
};

// 按冲突策略确定目标路径
// rename: 在扩展名前追加 _N，N从1递增直到isTaken返回false，最多maxAttempts次
ConflictResolution resolveConflict(const std::string& target, ConflictPolicy policy,
                                   const std::function<bool(const std::string&)>& isTaken,
                                   int maxAttempts);

// "dir/report.txt", 3 -> "dir/report_3.txt"
std::string numberedPath(const std::string& target, int counter);
