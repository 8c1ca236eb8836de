#include "common/scheduler.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <sstream>

Scheduler::Scheduler()
    : running_(false) {
}

Scheduler::~Scheduler() {
    stop();
}

bool Scheduler::scheduleTask(const std::string& taskId, Duration delay, TaskCallback callback) {
    if (!callback) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        tasks_[taskId] = {Clock::now() + delay, Duration(0), std::move(callback), false};
    }
    condition_.notify_one();
    return true;
}

bool Scheduler::schedulePeriodicTask(const std::string& taskId, Duration interval, TaskCallback callback) {
    if (!callback || interval.count() <= 0) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        tasks_[taskId] = {Clock::now() + interval, interval, std::move(callback), true};
    }
    condition_.notify_one();
    return true;
}

bool Scheduler::cancelTask(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    return tasks_.erase(taskId) > 0;
}

bool Scheduler::hasTask(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    return tasks_.find(taskId) != tasks_.end();
}

size_t Scheduler::pendingTaskCount() const {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    return tasks_.size();
}

void Scheduler::start() {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    if (!running_) {
        running_ = true;
        schedulerThread_ = std::thread(&Scheduler::schedulerLoop, this);
    }
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        running_ = false;
    }
    condition_.notify_all();
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
}

void Scheduler::processTasks() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    auto now = Clock::now();

    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second.scheduledTime <= now) {
            auto taskId = it->first;
            auto task = it->second;

            if (task.isPeriodic) {
                it->second.scheduledTime = now + task.interval;
                ++it;
            } else {
                it = tasks_.erase(it);
            }

            lock.unlock();
            executeTask(taskId, task);
            lock.lock();
            // The map may have changed while unlocked
            it = tasks_.upper_bound(taskId);
        } else {
            ++it;
        }
    }
}

void Scheduler::executeTask(const std::string& taskId, const Task& task) {
    try {
        task.callback();
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Scheduled task " << taskId << " failed: " << e.what();
        Logger::error(ss.str());
    }
}

void Scheduler::schedulerLoop() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    while (running_) {
        if (tasks_.empty()) {
            condition_.wait(lock, [this] {
                return !running_ || !tasks_.empty();
            });
            continue;
        }

        auto now = Clock::now();
        auto nextTask = std::min_element(tasks_.begin(), tasks_.end(),
            [](const auto& a, const auto& b) {
                return a.second.scheduledTime < b.second.scheduledTime;
            });

        if (nextTask->second.scheduledTime <= now) {
            auto taskId = nextTask->first;
            auto task = nextTask->second;

            if (task.isPeriodic) {
                nextTask->second.scheduledTime = now + task.interval;
            } else {
                tasks_.erase(nextTask);
            }

            lock.unlock();
            executeTask(taskId, task);
            lock.lock();
        } else {
            // Copy: the task may be erased while we wait
            TimePoint wakeAt = nextTask->second.scheduledTime;
            condition_.wait_until(lock, wakeAt);
        }
    }
}
