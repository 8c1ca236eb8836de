#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

// Fixed-size worker pool. Each migration runs as one task; tasks start in the
// order they were added.
class ParallelTaskManager {
public:
    explicit ParallelTaskManager(size_t numThreads = std::thread::hardware_concurrency());
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    // Queue a callable; the returned future carries its result or exception
    template<typename F>
    auto addTask(F&& f) -> std::future<typename std::result_of<F()>::type>;

    // Block until the queue is empty and no task is running
    void waitForAll();

private:
    void workerThread();
    void stop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idleCondition_;
    bool stop_;
    size_t activeTasks_;
};

template<typename F>
auto ParallelTaskManager::addTask(F&& f) -> std::future<typename std::result_of<F()>::type> {
    using return_type = typename std::result_of<F()>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_) {
            throw std::runtime_error("Cannot add task to stopped task manager");
        }
        // Exceptions thrown by f are stored in the future
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}
