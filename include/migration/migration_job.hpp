#pragma once

#include "migration/migration_status.hpp"
#include "migration/job_event.hpp"
#include "migration/transfer_meter.hpp"
#include <string>
#include <memory>
#include <functional>
#include <mutex>
#include <atomic>
#include <chrono>

// Point-in-time copy of a job's public fields
struct MigrationSnapshot {
    std::string containerId;
    std::string transferId;
    std::string sourceHostId;
    std::string targetHostId;
    MigrationPhase phase{MigrationPhase::Stopping};
    int progressPct{0};
    uint64_t bytesTransferred{0};
    uint64_t totalBytes{0};
    std::string error;
    MigrationError failureKind{MigrationError::None};
    bool cancelRequested{false};
    double speedBytesPerSec{0.0};
    uint64_t etaSeconds{0};          // 0 when unknown
    double elapsedSeconds{0.0};
    bool stalled{false};
};

// One in-flight migration of one container.
//
// Phase and byte fields are written only by the orchestrator task that owns
// the job; cancelRequested is the one field other threads may write. Every
// mutator takes the job lock, so readers always see a consistent record.
class MigrationJob {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    MigrationJob(const std::string& containerId,
                 const std::string& sourceHostId,
                 const std::string& targetHostId);

    MigrationJob(const MigrationJob&) = delete;
    MigrationJob& operator=(const MigrationJob&) = delete;

    const std::string& getContainerId() const { return containerId_; }
    const std::string& getTransferId() const { return transferId_; }
    const std::string& getSourceHostId() const { return sourceHostId_; }
    const std::string& getTargetHostId() const { return targetHostId_; }

    MigrationPhase getPhase() const;
    int getProgress() const;
    uint64_t getBytesTransferred() const;
    uint64_t getTotalBytes() const;
    std::string getError() const;
    MigrationError getFailureKind() const;
    bool isTerminal() const;
    bool isCompleted() const;
    bool isFailed() const;
    TimePoint getStartedAt() const { return startedAt_; }
    TimePoint getFinishedAt() const;

    // No byte or phase progress for longer than threshold while active
    bool isStalled(TimePoint now, std::chrono::seconds threshold) const;

    MigrationSnapshot snapshot() const;
    JobEvent toEvent() const;

    // Cancellation flag. requestCancel returns false once the job is terminal.
    bool requestCancel();
    bool isCancelRequested() const { return cancelRequested_.load(); }

    // Orchestrator-side mutators. Each returns false and changes nothing when
    // the update would break an invariant; on success `event` holds the state
    // to publish.
    bool advanceTo(MigrationPhase phase, JobEvent& event);
    bool setTotalBytes(uint64_t totalBytes);
    bool updateBytesTransferred(uint64_t bytes, TimePoint now, JobEvent& event);
    bool fail(MigrationError kind, const std::string& message, JobEvent& event);

    // Runs commit under the job lock and moves to Complete in the same critical
    // section. If commit throws, the job is left in Verifying.
    bool complete(const std::function<void()>& commit, JobEvent& event);

    // Starts a fresh throughput sample window (used when a transfer phase begins)
    void resetMeter(TimePoint now);

    static int computeProgress(MigrationPhase phase, uint64_t bytes, uint64_t total);

private:
    static std::string generateTransferId();
    JobEvent makeEventLocked() const;

    const std::string containerId_;
    const std::string sourceHostId_;
    const std::string targetHostId_;
    const std::string transferId_;
    const TimePoint startedAt_;

    MigrationPhase phase_{MigrationPhase::Stopping};
    uint64_t bytesTransferred_{0};
    uint64_t totalBytes_{0};
    std::string error_;
    MigrationError failureKind_{MigrationError::None};
    TimePoint lastProgressAt_;
    TimePoint finishedAt_;
    TransferMeter meter_;
    std::atomic<bool> cancelRequested_{false};
    mutable std::mutex mutex_;
};
