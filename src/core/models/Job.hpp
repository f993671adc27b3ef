#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include "../Types.hpp"

// 备份作业配置，由外部创建，引擎只读（软删除除外）
struct Job {
    int64_t id = 0;
    std::string name;
    std::vector<std::string> sources;          // 源路径（文件或目录），按顺序扫描
    std::vector<std::string> includePatterns;  // 通配符，为空表示全部包含
    std::vector<std::string> excludePatterns;  // 通配符，优先于包含模式
    std::string destinationType = "local";
    std::string destinationConfig = "{}";      // JSON文本，由连接器解释
    ConflictPolicy conflictPolicy = ConflictPolicy::RENAME;
    std::string schedule;                      // 仅保存，不做调度
    bool active = true;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
};
