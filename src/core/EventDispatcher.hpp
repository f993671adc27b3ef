#pragma once
#include <functional>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <chrono>

class ILogger;

// 观察者回调在独立线程上按投递顺序执行，执行线程只负责入队
class EventDispatcher {
public:
    using Event = std::function<void()>;

    explicit EventDispatcher(ILogger* logger = nullptr);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // 停止后投递的事件被丢弃
    void post(Event event);

    // 等待队列清空且没有正在执行的回调
    bool flush(std::chrono::milliseconds timeout);

    // 执行完剩余事件后结束线程
    void stop();

private:
    void run();

    ILogger* logger;
    std::queue<Event> events;
    std::mutex mutex;
    std::condition_variable eventCv;
    std::condition_variable drainedCv;
    bool stopping;
    bool busy;
    std::thread thread;
};
