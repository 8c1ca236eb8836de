#include "migration/job_store.hpp"
#include "common/logger.hpp"

MigrationError MigrationJobStore::tryCreate(const std::string& containerId,
                                            const std::string& sourceHostId,
                                            const std::string& targetHostId,
                                            std::shared_ptr<MigrationJob>& job) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(containerId);
    if (it != jobs_.end()) {
        if (!it->second->isTerminal()) {
            return MigrationError::AlreadyInProgress;
        }
        Logger::debug("Replacing finished migration " + it->second->getTransferId() +
                      " for container " + containerId);
    }

    job = std::make_shared<MigrationJob>(containerId, sourceHostId, targetHostId);
    jobs_[containerId] = job;
    return MigrationError::None;
}

std::shared_ptr<MigrationJob> MigrationJobStore::getJob(const std::string& containerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(containerId);
    return it != jobs_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<MigrationJob>> MigrationJobStore::getJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<MigrationJob>> result;
    result.reserve(jobs_.size());
    for (const auto& pair : jobs_) {
        result.push_back(pair.second);
    }
    return result;
}

bool MigrationJobStore::hasActiveJob(const std::string& containerId) const {
    auto job = getJob(containerId);
    return job && !job->isTerminal();
}

bool MigrationJobStore::removeJob(const std::string& containerId, const std::string& transferId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(containerId);
    if (it == jobs_.end() || it->second->getTransferId() != transferId) {
        return false;
    }
    jobs_.erase(it);
    return true;
}

MigrationError MigrationJobStore::dismissJob(const std::string& containerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(containerId);
    if (it == jobs_.end()) {
        return MigrationError::NotFound;
    }
    if (!it->second->isTerminal()) {
        return MigrationError::AlreadyInProgress;
    }
    jobs_.erase(it);
    return MigrationError::None;
}

size_t MigrationJobStore::cleanupCompletedJobs(MigrationJob::TimePoint now, std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        const auto& job = it->second;
        if (job->isCompleted() && now - job->getFinishedAt() >= grace) {
            it = jobs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t MigrationJobStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}
