#include "migration/migration_job.hpp"
#include <chrono>
#include <cmath>
#include <random>
#include <sstream>
#include <iomanip>

MigrationJob::MigrationJob(const std::string& containerId,
                           const std::string& sourceHostId,
                           const std::string& targetHostId)
    : containerId_(containerId)
    , sourceHostId_(sourceHostId)
    , targetHostId_(targetHostId)
    , transferId_(generateTransferId())
    , startedAt_(Clock::now())
    , lastProgressAt_(startedAt_)
    , finishedAt_(startedAt_)
    , meter_(0, startedAt_) {
}

std::string MigrationJob::generateTransferId() {
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }
    return ss.str();
}

int MigrationJob::computeProgress(MigrationPhase phase, uint64_t bytes, uint64_t total) {
    if (phase == MigrationPhase::Complete) {
        return 100;
    }
    if (total == 0) {
        return 0;
    }
    double pct = std::round(100.0 * static_cast<double>(bytes) / static_cast<double>(total));
    if (pct < 0.0) return 0;
    if (pct > 100.0) return 100;
    return static_cast<int>(pct);
}

MigrationPhase MigrationJob::getPhase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

int MigrationJob::getProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return computeProgress(phase_, bytesTransferred_, totalBytes_);
}

uint64_t MigrationJob::getBytesTransferred() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytesTransferred_;
}

uint64_t MigrationJob::getTotalBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalBytes_;
}

std::string MigrationJob::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

MigrationError MigrationJob::getFailureKind() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failureKind_;
}

bool MigrationJob::isTerminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isTerminalPhase(phase_);
}

bool MigrationJob::isCompleted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_ == MigrationPhase::Complete;
}

bool MigrationJob::isFailed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_ == MigrationPhase::Failed;
}

MigrationJob::TimePoint MigrationJob::getFinishedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finishedAt_;
}

bool MigrationJob::isStalled(TimePoint now, std::chrono::seconds threshold) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isTerminalPhase(phase_) || threshold.count() <= 0) {
        return false;
    }
    return now - lastProgressAt_ > threshold;
}

MigrationSnapshot MigrationJob::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MigrationSnapshot snap;
    snap.containerId = containerId_;
    snap.transferId = transferId_;
    snap.sourceHostId = sourceHostId_;
    snap.targetHostId = targetHostId_;
    snap.phase = phase_;
    snap.progressPct = computeProgress(phase_, bytesTransferred_, totalBytes_);
    snap.bytesTransferred = bytesTransferred_;
    snap.totalBytes = totalBytes_;
    snap.error = error_;
    snap.failureKind = failureKind_;
    snap.cancelRequested = cancelRequested_.load();

    bool transferring = phase_ == MigrationPhase::Transferring ||
                        phase_ == MigrationPhase::TransferringWorkspace;
    if (transferring) {
        snap.speedBytesPerSec = meter_.getSpeed();
        uint64_t eta = 0;
        if (meter_.getEtaSeconds(totalBytes_ - bytesTransferred_, eta)) {
            snap.etaSeconds = eta;
        }
    }

    TimePoint end = isTerminalPhase(phase_) ? finishedAt_ : Clock::now();
    snap.elapsedSeconds = std::chrono::duration<double>(end - startedAt_).count();
    return snap;
}

JobEvent MigrationJob::makeEventLocked() const {
    JobEvent event;
    event.containerId = containerId_;
    event.transferId = transferId_;
    event.phase = phase_;
    event.progressPct = computeProgress(phase_, bytesTransferred_, totalBytes_);
    event.bytesTransferred = bytesTransferred_;
    event.totalBytes = totalBytes_;
    if (phase_ == MigrationPhase::Failed) {
        event.error = error_;
    }
    return event;
}

JobEvent MigrationJob::toEvent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return makeEventLocked();
}

bool MigrationJob::requestCancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isTerminalPhase(phase_)) {
        return false;
    }
    cancelRequested_.store(true);
    return true;
}

bool MigrationJob::advanceTo(MigrationPhase phase, JobEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Complete and Failed have dedicated mutators
    if (isTerminalPhase(phase) || !isValidTransition(phase_, phase)) {
        return false;
    }
    phase_ = phase;
    lastProgressAt_ = Clock::now();
    event = makeEventLocked();
    return true;
}

bool MigrationJob::setTotalBytes(uint64_t totalBytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (totalBytes_ != 0 || totalBytes == 0 || isTerminalPhase(phase_)) {
        return false;
    }
    totalBytes_ = totalBytes;
    return true;
}

bool MigrationJob::updateBytesTransferred(uint64_t bytes, TimePoint now, JobEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != MigrationPhase::Transferring && phase_ != MigrationPhase::TransferringWorkspace) {
        return false;
    }
    if (bytes <= bytesTransferred_ || bytes > totalBytes_) {
        return false;
    }
    bytesTransferred_ = bytes;
    lastProgressAt_ = now;
    meter_.observe(bytes, now);
    event = makeEventLocked();
    return true;
}

bool MigrationJob::fail(MigrationError kind, const std::string& message, JobEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isTerminalPhase(phase_)) {
        return false;
    }
    phase_ = MigrationPhase::Failed;
    failureKind_ = kind;
    error_ = message.empty() ? errorToString(kind) : message;
    finishedAt_ = Clock::now();
    event = makeEventLocked();
    return true;
}

bool MigrationJob::complete(const std::function<void()>& commit, JobEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != MigrationPhase::Verifying) {
        return false;
    }
    if (commit) {
        commit();
    }
    phase_ = MigrationPhase::Complete;
    finishedAt_ = Clock::now();
    event = makeEventLocked();
    return true;
}

void MigrationJob::resetMeter(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    meter_.reset(bytesTransferred_, now);
}
