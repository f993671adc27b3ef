#include "ConflictResolver.hpp"
#include <filesystem>

namespace fs = std::filesystem;

std::string numberedPath(const std::string& target, int counter) {
    fs::path path(target);
    std::string name = path.stem().string() + "_" + std::to_string(counter) + path.extension().string();
    return (path.parent_path() / name).string();
}

ConflictResolution resolveConflict(const std::string& target, ConflictPolicy policy,
                                   const std::function<bool(const std::string&)>& isTaken,
                                   int maxAttempts) {
    ConflictResolution resolution;
    resolution.path = target;

    if (policy == ConflictPolicy::OVERWRITE || !isTaken(target)) {
        return resolution;
    }

    if (policy == ConflictPolicy::SKIP) {
        resolution.skip = true;
        return resolution;
    }

    for (int counter = 1; counter <= maxAttempts; ++counter) {
        std::string candidate = numberedPath(target, counter);
        if (!isTaken(candidate)) {
            resolution.path = candidate;
            return resolution;
        }
    }

    resolution.downgraded = true;
    return resolution;
}
