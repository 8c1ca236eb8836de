#pragma once

#include "migration/migration_job.hpp"
#include "migration/migration_status.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <chrono>

// Registry of migration jobs keyed by container id.
//
// At most one non-terminal job exists per container. The map lock is held only
// for lookups and inserts; job fields are guarded by each job's own lock.
class MigrationJobStore {
public:
    MigrationJobStore() = default;

    MigrationJobStore(const MigrationJobStore&) = delete;
    MigrationJobStore& operator=(const MigrationJobStore&) = delete;

    // Creates a job unless a non-terminal one already exists for containerId
    // (AlreadyInProgress). A terminal job for the same container is replaced.
    MigrationError tryCreate(const std::string& containerId,
                             const std::string& sourceHostId,
                             const std::string& targetHostId,
                             std::shared_ptr<MigrationJob>& job);

    std::shared_ptr<MigrationJob> getJob(const std::string& containerId) const;
    std::vector<std::shared_ptr<MigrationJob>> getJobs() const;
    bool hasActiveJob(const std::string& containerId) const;

    // Removes the job only if it is still the one identified by transferId
    bool removeJob(const std::string& containerId, const std::string& transferId);

    // Removes a terminal job. NotFound when there is none, AlreadyInProgress
    // while the job is still running.
    MigrationError dismissJob(const std::string& containerId);

    // Drops completed jobs finished more than grace ago. Failed jobs stay.
    size_t cleanupCompletedJobs(MigrationJob::TimePoint now, std::chrono::milliseconds grace);

    size_t size() const;

private:
    std::unordered_map<std::string, std::shared_ptr<MigrationJob>> jobs_;
    mutable std::mutex mutex_;
};
