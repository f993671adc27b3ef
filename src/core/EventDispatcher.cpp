#include "EventDispatcher.hpp"
#include "../utils/ILogger.hpp"
#include <exception>

EventDispatcher::EventDispatcher(ILogger* logger)
    : logger(logger), stopping(false), busy(false) {
    thread = std::thread(&EventDispatcher::run, this);
}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::post(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping) {
            return;
        }
        events.push(std::move(event));
    }
    eventCv.notify_one();
}

bool EventDispatcher::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return drainedCv.wait_for(lock, timeout, [this]() {
        return events.empty() && !busy;
    });
}

void EventDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    eventCv.notify_one();
    if (thread.joinable()) {
        thread.join();
    }
}

void EventDispatcher::run() {
    std::unique_lock<std::mutex> lock(mutex);
    while (true) {
        eventCv.wait(lock, [this]() {
            return !events.empty() || stopping;
        });
        if (events.empty() && stopping) {
            break;
        }

        Event event = std::move(events.front());
        events.pop();
        busy = true;
        lock.unlock();

        try {
            event();
        } catch (const std::exception& e) {
            if (logger) {
                logger->error(std::string("Observer callback failed: ") + e.what());
            }
        }

        lock.lock();
        busy = false;
        if (events.empty()) {
            drainedCv.notify_all();
        }
    }
    drainedCv.notify_all();
}
