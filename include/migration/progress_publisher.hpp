#pragma once

#include "migration/job_event.hpp"
#include <memory>
#include <string>
#include <vector>
#include <deque>
#include <unordered_set>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <atomic>

class ProgressPublisher;

// Bounded per-subscriber event queue. When full, the oldest progress event is
// dropped; terminal events stay queued while any progress event remains.
class Subscription {
public:
    explicit Subscription(size_t capacity);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Non-blocking; false if nothing is queued
    bool poll(JobEvent& event);

    // Waits up to timeout for an event; false on timeout or after close()
    bool waitNext(JobEvent& event, std::chrono::milliseconds timeout);

    // Pops every queued event
    std::vector<JobEvent> drain();

    size_t pending() const;
    size_t droppedCount() const;
    size_t capacity() const { return capacity_; }

    void close();
    bool isClosed() const;

private:
    friend class ProgressPublisher;
    void push(const JobEvent& event);

    const size_t capacity_;
    std::deque<JobEvent> queue_;
    size_t dropped_{0};
    bool closed_{false};
    mutable std::mutex mutex_;
    std::condition_variable condition_;
};

// Fan-out of job events to any number of subscribers.
//
// publish() never waits on a subscriber. Events for a transfer that already
// published its terminal event are discarded.
class ProgressPublisher {
public:
    explicit ProgressPublisher(size_t defaultQueueDepth = 256);

    ProgressPublisher(const ProgressPublisher&) = delete;
    ProgressPublisher& operator=(const ProgressPublisher&) = delete;

    // queueDepth 0 uses the default depth
    std::shared_ptr<Subscription> subscribe(size_t queueDepth = 0);
    void unsubscribe(const std::shared_ptr<Subscription>& subscription);

    // Returns false when the event was discarded by the terminal gate
    bool publish(const JobEvent& event);

    size_t subscriberCount() const;
    uint64_t publishedCount() const { return published_.load(); }

private:
    static constexpr size_t kMaxRememberedTransfers = 4096;

    bool admitLocked(const JobEvent& event);

    size_t defaultQueueDepth_;
    std::vector<std::weak_ptr<Subscription>> subscribers_;
    std::unordered_set<std::string> finishedTransfers_;
    std::deque<std::string> finishedOrder_;
    std::atomic<uint64_t> published_{0};
    mutable std::mutex mutex_;
};
