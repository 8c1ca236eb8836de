#include "common/parallel_task_manager.hpp"
#include "common/logger.hpp"
#include <algorithm>

ParallelTaskManager::ParallelTaskManager(size_t numThreads)
    : stop_(false)
    , activeTasks_(0) {
    if (numThreads == 0) {
        numThreads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ParallelTaskManager::workerThread, this);
    }
}

ParallelTaskManager::~ParallelTaskManager() {
    stop();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void ParallelTaskManager::waitForAll() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idleCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_ == 0;
    });
}

void ParallelTaskManager::stop() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stop_ = true;
    }
    condition_.notify_all();
}

void ParallelTaskManager::workerThread() {
    while (true) {
        std::function<void()> taskFunc;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !tasks_.empty() || stop_;
            });

            // Queued tasks are drained before the workers exit
            if (stop_ && tasks_.empty()) {
                return;
            }

            taskFunc = std::move(tasks_.front());
            tasks_.pop();
            ++activeTasks_;
        }

        try {
            taskFunc();
        } catch (const std::exception& e) {
            Logger::error(std::string("Worker task threw: ") + e.what());
        }

        std::lock_guard<std::mutex> lock(queueMutex_);
        --activeTasks_;
        if (tasks_.empty() && activeTasks_ == 0) {
            idleCondition_.notify_all();
        }
    }
}
