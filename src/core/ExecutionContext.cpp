#include "ExecutionContext.hpp"

ExecutionContext::ExecutionContext(std::chrono::milliseconds pollInterval)
    : pauseRequested(false), stopRequested(false), suspendRequested(false), pollInterval(pollInterval) {}

void ExecutionContext::requestPause() {
    std::lock_guard<std::mutex> lock(mutex);
    pauseRequested = true;
}

void ExecutionContext::requestResume() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        pauseRequested = false;
        suspendRequested = false;
    }
    cv.notify_all();
}

void ExecutionContext::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopRequested = true;
    }
    // 唤醒暂停中的线程
    cv.notify_all();
}

void ExecutionContext::requestSuspend() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        pauseRequested = true;
        suspendRequested = true;
    }
    cv.notify_all();
}

bool ExecutionContext::isPauseRequested() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pauseRequested;
}

bool ExecutionContext::isStopRequested() const {
    std::lock_guard<std::mutex> lock(mutex);
    return stopRequested;
}

bool ExecutionContext::isSuspendRequested() const {
    std::lock_guard<std::mutex> lock(mutex);
    return suspendRequested;
}

bool ExecutionContext::shouldInterrupt() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pauseRequested || stopRequested;
}

ControlSignal ExecutionContext::poll() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (stopRequested) {
        return ControlSignal::STOP;
    }
    if (pauseRequested) {
        return ControlSignal::PAUSE;
    }
    return ControlSignal::CONTINUE;
}

ControlSignal ExecutionContext::waitWhilePaused() {
    std::unique_lock<std::mutex> lock(mutex);
    while (true) {
        if (stopRequested) {
            return ControlSignal::STOP;
        }
        if (suspendRequested) {
            return ControlSignal::PAUSE;
        }
        if (!pauseRequested) {
            return ControlSignal::CONTINUE;
        }
        // 有界等待，即使通知丢失也能及时看到停止请求
        cv.wait_for(lock, pollInterval);
    }
}

void ExecutionContext::reset() {
    std::lock_guard<std::mutex> lock(mutex);
    pauseRequested = false;
    stopRequested = false;
    suspendRequested = false;
}
