#include "migration/progress_publisher.hpp"
#include "common/logger.hpp"
#include <algorithm>

Subscription::Subscription(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

void Subscription::push(const JobEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (queue_.size() >= capacity_) {
            // Terminal events are evicted only when nothing else is left to drop
            auto victim = std::find_if(queue_.begin(), queue_.end(),
                                       [](const JobEvent& queued) { return !isTerminalPhase(queued.phase); });
            if (victim == queue_.end()) {
                victim = queue_.begin();
            }
            queue_.erase(victim);
            ++dropped_;
        }
        queue_.push_back(event);
    }
    condition_.notify_one();
}

bool Subscription::poll(JobEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

bool Subscription::waitNext(JobEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!condition_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
        return false;
    }
    if (queue_.empty()) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

std::vector<JobEvent> Subscription::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobEvent> events(queue_.begin(), queue_.end());
    queue_.clear();
    return events;
}

size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t Subscription::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

bool Subscription::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

ProgressPublisher::ProgressPublisher(size_t defaultQueueDepth)
    : defaultQueueDepth_(defaultQueueDepth == 0 ? 1 : defaultQueueDepth) {
}

std::shared_ptr<Subscription> ProgressPublisher::subscribe(size_t queueDepth) {
    auto subscription = std::make_shared<Subscription>(queueDepth == 0 ? defaultQueueDepth_ : queueDepth);
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
}

void ProgressPublisher::unsubscribe(const std::shared_ptr<Subscription>& subscription) {
    if (!subscription) {
        return;
    }
    subscription->close();
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
            [&subscription](const std::weak_ptr<Subscription>& weak) {
                auto locked = weak.lock();
                return !locked || locked == subscription;
            }),
        subscribers_.end());
}

bool ProgressPublisher::admitLocked(const JobEvent& event) {
    if (finishedTransfers_.count(event.transferId) > 0) {
        return false;
    }
    if (isTerminalPhase(event.phase)) {
        finishedTransfers_.insert(event.transferId);
        finishedOrder_.push_back(event.transferId);
        if (finishedOrder_.size() > kMaxRememberedTransfers) {
            finishedTransfers_.erase(finishedOrder_.front());
            finishedOrder_.pop_front();
        }
    }
    return true;
}

bool ProgressPublisher::publish(const JobEvent& event) {
    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!admitLocked(event)) {
            Logger::warning("Dropping " + phaseToString(event.phase) + " event for finished transfer " +
                            event.transferId + " (container " + event.containerId + ")");
            return false;
        }

        targets.reserve(subscribers_.size());
        for (auto it = subscribers_.begin(); it != subscribers_.end();) {
            auto subscription = it->lock();
            if (!subscription || subscription->isClosed()) {
                it = subscribers_.erase(it);
            } else {
                targets.push_back(std::move(subscription));
                ++it;
            }
        }
    }

    // Queue pushes only take each subscriber's own lock
    for (const auto& subscription : targets) {
        subscription->push(event);
    }
    published_++;
    return true;
}

size_t ProgressPublisher::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& weak : subscribers_) {
        auto subscription = weak.lock();
        if (subscription && !subscription->isClosed()) {
            ++count;
        }
    }
    return count;
}
