#pragma once
#include <mutex>
#include <condition_variable>
#include <chrono>

enum class ControlSignal {
    CONTINUE,
    PAUSE,
    STOP
};

// 执行线程与控制方共享的暂停/停止标志
class ExecutionContext {
public:
    explicit ExecutionContext(std::chrono::milliseconds pollInterval = std::chrono::milliseconds(1000));

    void requestPause();
    void requestResume();
    void requestStop();
    // 暂停并在检查点保存后让执行线程退出，执行记录保持paused
    void requestSuspend();

    bool isPauseRequested() const;
    bool isStopRequested() const;
    bool isSuspendRequested() const;

    // 扫描时在目录之间调用
    bool shouldInterrupt() const;

    // 非阻塞检查，STOP优先于PAUSE
    ControlSignal poll() const;

    // 暂停期间阻塞，每隔pollInterval醒来检查一次停止标志
    // 返回CONTINUE表示已恢复，STOP表示停止，PAUSE表示要求释放执行线程
    ControlSignal waitWhilePaused();

    void reset();

private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool pauseRequested;
    bool stopRequested;
    bool suspendRequested;
    std::chrono::milliseconds pollInterval;
};
