#pragma once

#include "common/migration_config.hpp"
#include "common/parallel_task_manager.hpp"
#include "common/scheduler.hpp"
#include "migration/artifact_transport.hpp"
#include "migration/cancellation_controller.hpp"
#include "migration/container_inventory.hpp"
#include "migration/container_lifecycle.hpp"
#include "migration/host_registry.hpp"
#include "migration/job_store.hpp"
#include "migration/migration_job.hpp"
#include "migration/progress_publisher.hpp"
#include <memory>
#include <string>
#include <vector>

struct StartResult {
    MigrationError error{MigrationError::None};
    std::string message;
    std::shared_ptr<MigrationJob> job;

    bool ok() const { return error == MigrationError::None && job != nullptr; }
};

// Drives container migrations through
//   stopping -> exporting -> transferring -> transferring_workspace
//   -> importing -> importing_workspace -> starting -> verifying -> complete
// with failed reachable from every active phase.
//
// Each migration runs as one task on the worker pool. Phases of a job run
// strictly in sequence; every transition is one job update followed by one
// published event. Cancellation is honoured only when entering a phase.
class MigrationOrchestrator {
public:
    MigrationOrchestrator(const MigrationConfig& config,
                          std::shared_ptr<HostRegistry> registry,
                          std::shared_ptr<ContainerLifecycle> lifecycle,
                          std::shared_ptr<ArtifactTransport> transport,
                          std::shared_ptr<ContainerInventory> inventory,
                          std::shared_ptr<MigrationJobStore> store,
                          std::shared_ptr<ProgressPublisher> publisher);
    ~MigrationOrchestrator();

    MigrationOrchestrator(const MigrationOrchestrator&) = delete;
    MigrationOrchestrator& operator=(const MigrationOrchestrator&) = delete;

    // Validates the request, creates the job and queues it. Returns at once;
    // the job handle reports progress. "local" names this host.
    StartResult startMigration(const std::string& containerId, const std::string& requestedTarget);

    MigrationError cancel(const std::string& containerId);

    // Latest job for the container, finished or not
    bool status(const std::string& containerId, MigrationSnapshot& snapshot) const;
    std::vector<MigrationSnapshot> listMigrations() const;

    // Forget a finished job so the operator no longer sees it
    MigrationError dismiss(const std::string& containerId);

    // Block until no migration is queued or running
    void waitForAll();

    std::shared_ptr<ProgressPublisher> getPublisher() const { return publisher_; }
    std::shared_ptr<MigrationJobStore> getJobStore() const { return store_; }

private:
    // What a run has created so far, for cleanup on abort
    struct RunState {
        bool sourceStopped{false};
        bool imageExported{false};
        bool workspaceExported{false};
        bool imageDelivered{false};
        bool workspaceDelivered{false};
        bool targetStarted{false};
        Artifact image;
        Artifact workspace;
        Artifact deliveredImage;
        Artifact deliveredWorkspace;
    };

    void runMigration(const std::shared_ptr<MigrationJob>& job);
    bool executePhases(const std::shared_ptr<MigrationJob>& job, RunState& run);

    // Checks for a pending cancel, then moves the job to phase and publishes.
    // Returns false when the job was aborted instead.
    bool enterPhase(const std::shared_ptr<MigrationJob>& job, RunState& run, MigrationPhase phase);

    bool transferArtifact(const std::shared_ptr<MigrationJob>& job, const Artifact& artifact,
                          uint64_t baseBytes, Artifact& delivered, std::string& error);

    // Best-effort cleanup, then the terminal failed event
    void abort(const std::shared_ptr<MigrationJob>& job, RunState& run,
               MigrationError kind, const std::string& message);
    void cleanupAfterAbort(const std::shared_ptr<MigrationJob>& job, RunState& run);
    void removeStagedArtifacts(const std::shared_ptr<MigrationJob>& job, RunState& run);

    void finish(const std::shared_ptr<MigrationJob>& job, RunState& run);
    void scheduleReap(const std::shared_ptr<MigrationJob>& job);
    void housekeeping();
    void reportStalledJobs();
    void publish(const JobEvent& event);

    static std::string describeFailure(MigrationError kind, const std::string& detail);

    static constexpr int kHousekeepingIntervalSeconds = 10;

    MigrationConfig config_;
    std::shared_ptr<HostRegistry> registry_;
    std::shared_ptr<ContainerLifecycle> lifecycle_;
    std::shared_ptr<ArtifactTransport> transport_;
    std::shared_ptr<ContainerInventory> inventory_;
    std::shared_ptr<MigrationJobStore> store_;
    std::shared_ptr<ProgressPublisher> publisher_;
    CancellationController cancellation_;
    Scheduler scheduler_;

    // Declared last: destroyed first, so running tasks finish while the
    // collaborators above are still alive
    std::unique_ptr<ParallelTaskManager> taskManager_;
};
