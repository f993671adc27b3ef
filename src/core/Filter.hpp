#pragma once
#include <string>
#include <vector>
#include "models/File.hpp"

class Filter {
public:
    virtual ~Filter() = default;
    virtual bool match(const File& file) const = 0;

    virtual std::string getFilterDescription() const = 0;
};

// 通配符过滤器（fnmatch语义），同时匹配文件名与完整路径
// 排除模式优先：命中任一排除模式即被过滤；包含列表非空时至少命中一个包含模式
class PatternFilter: public Filter {
private:
    std::vector<std::string> includePatterns;
    std::vector<std::string> excludePatterns;

    static bool matchesAny(const std::vector<std::string>& patterns,
                           const std::string& fileName, const std::string& fullPath);

public:
    PatternFilter() = default;
    PatternFilter(const std::vector<std::string>& includes, const std::vector<std::string>& excludes);
    ~PatternFilter() = default;

    // 首尾空白会被去除，空模式被忽略
    void addIncludePattern(const std::string& pattern);
    bool removeIncludePattern(const std::string& pattern);
    void addExcludePattern(const std::string& pattern);
    bool removeExcludePattern(const std::string& pattern);
    void clearIncludePatterns();
    void clearExcludePatterns();

    const std::vector<std::string>& getIncludePatterns() const {
        return this->includePatterns;
    }
    const std::vector<std::string>& getExcludePatterns() const {
        return this->excludePatterns;
    }

    bool matchPath(const std::string& path) const;
    bool match(const File& file) const override;
    std::string getFilterDescription() const override;
};
