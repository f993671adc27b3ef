#pragma once
#include <string>
#include "models/Job.hpp"

// 作业描述文件（JSON）的读写
// {
//   "name": "documents",
//   "sources": ["/home/me/docs"],
//   "include_patterns": ["*.txt"],
//   "exclude_patterns": ["*.tmp"],
//   "destination_type": "local",
//   "destination": {"local_path": "/backup"},
//   "conflict_policy": "rename",
//   "schedule": ""
// }
class JobFile {
public:
    static bool parse(const std::string& text, Job& job, std::string& error);

    static bool load(const std::string& path, Job& job, std::string& error);

    static std::string toJson(const Job& job);
};
