#pragma once

#include <string>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <map>
#include <atomic>
#include <chrono>

// Runs delayed or periodic callbacks on a background thread.
class Scheduler {
public:
    using TaskCallback = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::milliseconds;

    Scheduler();
    ~Scheduler();

    // Run a task once after the given delay. Re-using a taskId replaces
    // the pending task.
    bool scheduleTask(const std::string& taskId, Duration delay, TaskCallback callback);

    // Run a task every interval
    bool schedulePeriodicTask(const std::string& taskId, Duration interval, TaskCallback callback);

    bool cancelTask(const std::string& taskId);
    bool hasTask(const std::string& taskId) const;
    size_t pendingTaskCount() const;

    void start();
    void stop();

    // Run every task whose time has come on the calling thread
    void processTasks();

private:
    struct Task {
        TimePoint scheduledTime;
        Duration interval;
        TaskCallback callback;
        bool isPeriodic;
    };

    void schedulerLoop();
    void executeTask(const std::string& taskId, const Task& task);

    std::map<std::string, Task> tasks_;
    mutable std::mutex tasksMutex_;
    std::condition_variable condition_;
    std::thread schedulerThread_;
    std::atomic<bool> running_;
};
