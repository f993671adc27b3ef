#include "Execution.hpp"
#include <algorithm>

int Execution::progressPercentage() const {
    if (totalFiles <= 0) {
        return 0;
    }
    int percentage = static_cast<int>((static_cast<int64_t>(processedFiles) * 100) / totalFiles);
    return std::min(100, percentage);
}

double Execution::transferRateMBps(TimePoint now) const {
    if (transferredBytes == 0) {
        return 0.0;
    }
    TimePoint end = completedAt ? *completedAt : now;
    double seconds = std::chrono::duration<double>(end - startedAt).count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return (static_cast<double>(transferredBytes) / (1024.0 * 1024.0)) / seconds;
}
