#include "Filter.hpp"
#include <algorithm>
#include <fnmatch.h>

static std::string trimPattern(const std::string& pattern) {
    const char* blanks = " \t\r\n";
    size_t begin = pattern.find_first_not_of(blanks);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = pattern.find_last_not_of(blanks);
    return pattern.substr(begin, end - begin + 1);
}

PatternFilter::PatternFilter(const std::vector<std::string>& includes, const std::vector<std::string>& excludes) {
    for (const auto& pattern : includes) {
        addIncludePattern(pattern);
    }
    for (const auto& pattern : excludes) {
        addExcludePattern(pattern);
    }
}

void PatternFilter::addIncludePattern(const std::string& pattern) {
    std::string trimmed = trimPattern(pattern);
    if (!trimmed.empty()) {
        includePatterns.push_back(trimmed);
    }
}

bool PatternFilter::removeIncludePattern(const std::string& pattern) {
    auto it = std::find(includePatterns.begin(), includePatterns.end(), trimPattern(pattern));
    if (it != includePatterns.end()) {
        includePatterns.erase(it);
        return true;
    }
    return false;
}

void PatternFilter::addExcludePattern(const std::string& pattern) {
    std::string trimmed = trimPattern(pattern);
    if (!trimmed.empty()) {
        excludePatterns.push_back(trimmed);
    }
}

bool PatternFilter::removeExcludePattern(const std::string& pattern) {
    auto it = std::find(excludePatterns.begin(), excludePatterns.end(), trimPattern(pattern));
    if (it != excludePatterns.end()) {
        excludePatterns.erase(it);
        return true;
    }
    return false;
}

void PatternFilter::clearIncludePatterns() {
    includePatterns.clear();
}

void PatternFilter::clearExcludePatterns() {
    excludePatterns.clear();
}

bool PatternFilter::matchesAny(const std::vector<std::string>& patterns,
                               const std::string& fileName, const std::string& fullPath) {
    for (const auto& pattern : patterns) {
        // 不带FNM_PATHNAME，'*' 可以跨越路径分隔符
        if (fnmatch(pattern.c_str(), fileName.c_str(), 0) == 0 ||
            fnmatch(pattern.c_str(), fullPath.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

bool PatternFilter::matchPath(const std::string& path) const {
    std::string fileName = fs::path(path).filename().string();

    // 1. 排除模式优先级最高
    if (matchesAny(excludePatterns, fileName, path)) {
        return false;
    }

    // 2. 设置了包含模式时必须至少命中一个
    if (!includePatterns.empty()) {
        return matchesAny(includePatterns, fileName, path);
    }

    return true;
}

bool PatternFilter::match(const File& file) const {
    return matchPath(file.getFilePath().string());
}

std::string PatternFilter::getFilterDescription() const {
    std::string desc = "Pattern Filter: ";

    if (includePatterns.empty() && excludePatterns.empty()) {
        desc += "no patterns, all files match";
        return desc;
    }

    auto join = [](const std::vector<std::string>& patterns) {
        std::string joined;
        for (size_t i = 0; i < patterns.size(); ++i) {
            joined += patterns[i];
            if (i < patterns.size() - 1) {
                joined += ", ";
            }
        }
        return joined;
    };

    if (!includePatterns.empty()) {
        desc += "include (" + std::to_string(includePatterns.size()) + "): [" + join(includePatterns) + "]";
    }
    if (!includePatterns.empty() && !excludePatterns.empty()) {
        desc += ", ";
    }
    if (!excludePatterns.empty()) {
        desc += "exclude (" + std::to_string(excludePatterns.size()) + "): [" + join(excludePatterns) + "]";
    }
    return desc;
}
