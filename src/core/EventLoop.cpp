#include "core/EventLoop.h"
#include "utils/Logger.h"
#include <exception>

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        tasks.push_back(std::move(task));
    }
    cv.notify_one();
}

bool EventLoop::runOne(std::unique_lock<std::mutex>& lock) {
    if (tasks.empty()) return false;
    Task task = std::move(tasks.front());
    tasks.pop_front();
    lock.unlock();
    try {
        task();
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Event loop task failed: ") + e.what());
    }
    lock.lock();
    return true;
}

void EventLoop::run(std::chrono::milliseconds tick, const std::function<void()>& onTick) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        loopThread = std::this_thread::get_id();
    }
    stopRequested = false;
    running = true;

    std::unique_lock<std::mutex> lock(mtx);
    while (!stopRequested) {
        if (!runOne(lock)) {
            cv.wait_for(lock, tick, [this] { return !tasks.empty() || stopRequested.load(); });
            if (onTick && tasks.empty() && !stopRequested) {
                lock.unlock();
                onTick();
                lock.lock();
            }
        }
    }
    loopThread = std::thread::id();
    running = false;
}

std::size_t EventLoop::runFor(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::size_t count = 0;
    std::unique_lock<std::mutex> lock(mtx);
    auto previous = loopThread;
    loopThread = std::this_thread::get_id();
    while (std::chrono::steady_clock::now() < deadline) {
        if (runOne(lock)) {
            ++count;
            continue;
        }
        if (!cv.wait_until(lock, deadline, [this] { return !tasks.empty(); })) break;
    }
    loopThread = previous;
    return count;
}

void EventLoop::stop() {
    stopRequested = true;
    cv.notify_all();
}

bool EventLoop::isLoopThread() const {
    std::lock_guard<std::mutex> lock(mtx);
    return loopThread == std::this_thread::get_id();
}
