#pragma once
#include <functional>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>

class EventLoop {
public:
    using Task = std::function<void()>;

    void post(Task task);

    // `onTick` runs at least every `tick` while idle
    void run(std::chrono::milliseconds tick = std::chrono::milliseconds(100),
             const std::function<void()>& onTick = nullptr);

    // Runs tasks as they arrive until `timeout` elapses; returns tasks run
    std::size_t runFor(std::chrono::milliseconds timeout);

    void stop();
    bool isRunning() const { return running.load(); }
    bool isLoopThread() const;

private:
    std::deque<Task> tasks;
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{false};
    std::atomic<bool> stopRequested{false};
    std::thread::id loopThread;

    bool runOne(std::unique_lock<std::mutex>& lock);
};
