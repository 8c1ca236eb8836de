#include "migration/migration_orchestrator.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

MigrationOrchestrator::MigrationOrchestrator(const MigrationConfig& config,
                                             std::shared_ptr<HostRegistry> registry,
                                             std::shared_ptr<ContainerLifecycle> lifecycle,
                                             std::shared_ptr<ArtifactTransport> transport,
                                             std::shared_ptr<ContainerInventory> inventory,
                                             std::shared_ptr<MigrationJobStore> store,
                                             std::shared_ptr<ProgressPublisher> publisher)
    : config_(config)
    , registry_(std::move(registry))
    , lifecycle_(std::move(lifecycle))
    , transport_(std::move(transport))
    , inventory_(std::move(inventory))
    , store_(std::move(store))
    , publisher_(std::move(publisher))
    , cancellation_(store_)
    , taskManager_(std::make_unique<ParallelTaskManager>(
          static_cast<size_t>(std::max(1, config.maxConcurrentMigrations)))) {
    if (!registry_ || !lifecycle_ || !transport_ || !inventory_ || !store_ || !publisher_) {
        throw std::invalid_argument("MigrationOrchestrator requires all collaborators");
    }

    scheduler_.start();
    scheduler_.schedulePeriodicTask("housekeeping", std::chrono::seconds(kHousekeepingIntervalSeconds),
                                    [this]() { housekeeping(); });
}

MigrationOrchestrator::~MigrationOrchestrator() {
    try {
        taskManager_->waitForAll();
        scheduler_.stop();
    } catch (const std::exception& e) {
        Logger::error("Error during MigrationOrchestrator shutdown: " + std::string(e.what()));
    }
}

std::string MigrationOrchestrator::describeFailure(MigrationError kind, const std::string& detail) {
    switch (kind) {
        case MigrationError::LifecycleFailure:
            return "Lifecycle failure: " + detail;
        case MigrationError::TransferFailure:
            return "Transfer failure: " + detail;
        case MigrationError::VerificationTimeout:
            return "Verification timeout: " + detail;
        case MigrationError::Cancelled:
            return "Migration cancelled by operator";
        default:
            return errorToString(kind) + ": " + detail;
    }
}

void MigrationOrchestrator::publish(const JobEvent& event) {
    publisher_->publish(event);
}

StartResult MigrationOrchestrator::startMigration(const std::string& containerId, const std::string& requestedTarget) {
    StartResult result;
    const std::string targetHostId = registry_->resolve(requestedTarget);

    ContainerRecord container;
    if (containerId.empty() || !inventory_->getContainer(containerId, container)) {
        result.error = MigrationError::NotFound;
        result.message = "Unknown container: " + containerId;
        Logger::warning("Migration rejected: " + result.message);
        return result;
    }

    if (store_->hasActiveJob(containerId)) {
        result.error = MigrationError::AlreadyInProgress;
        result.message = "A migration is already in progress for " + containerId;
        Logger::warning("Migration rejected: " + result.message);
        return result;
    }

    if (targetHostId == registry_->resolve(container.hostId)) {
        result.error = MigrationError::InvalidTarget;
        result.message = "Container " + containerId + " already runs on " + targetHostId;
        Logger::warning("Migration rejected: " + result.message);
        return result;
    }

    std::string reason;
    if (!registry_->isValidTarget(targetHostId, reason)) {
        result.error = MigrationError::InvalidTarget;
        result.message = reason;
        Logger::warning("Migration rejected for " + containerId + ": " + reason);
        return result;
    }

    std::shared_ptr<MigrationJob> job;
    MigrationError created = store_->tryCreate(containerId, container.hostId, targetHostId, job);
    if (created != MigrationError::None) {
        result.error = created;
        result.message = "A migration is already in progress for " + containerId;
        Logger::warning("Migration rejected: " + result.message);
        return result;
    }

    Logger::info("Migration " + job->getTransferId() + " accepted: " + containerId + " " +
                 container.hostId + " -> " + targetHostId);
    inventory_->setStatus(containerId, "migrating");
    publish(job->toEvent());

    try {
        taskManager_->addTask([this, job]() { runMigration(job); });
    } catch (const std::exception& e) {
        JobEvent event;
        if (job->fail(MigrationError::LifecycleFailure,
                      describeFailure(MigrationError::LifecycleFailure, e.what()), event)) {
            publish(event);
        }
        inventory_->setStatus(containerId, container.status);
        Logger::error("Failed to queue migration " + job->getTransferId() + ": " + e.what());
    }

    result.job = job;
    return result;
}

MigrationError MigrationOrchestrator::cancel(const std::string& containerId) {
    return cancellation_.requestCancel(containerId);
}

bool MigrationOrchestrator::status(const std::string& containerId, MigrationSnapshot& snapshot) const {
    auto job = store_->getJob(containerId);
    if (!job) {
        return false;
    }
    snapshot = job->snapshot();
    snapshot.stalled = job->isStalled(MigrationJob::Clock::now(),
                                      std::chrono::seconds(config_.stallThresholdSeconds));
    return true;
}

std::vector<MigrationSnapshot> MigrationOrchestrator::listMigrations() const {
    std::vector<MigrationSnapshot> snapshots;
    auto now = MigrationJob::Clock::now();
    for (const auto& job : store_->getJobs()) {
        MigrationSnapshot snapshot = job->snapshot();
        snapshot.stalled = job->isStalled(now, std::chrono::seconds(config_.stallThresholdSeconds));
        snapshots.push_back(snapshot);
    }
    std::sort(snapshots.begin(), snapshots.end(),
              [](const MigrationSnapshot& a, const MigrationSnapshot& b) {
                  return a.containerId < b.containerId;
              });
    return snapshots;
}

MigrationError MigrationOrchestrator::dismiss(const std::string& containerId) {
    MigrationError result = store_->dismissJob(containerId);
    if (result == MigrationError::None) {
        Logger::info("Dismissed migration record for " + containerId);
    }
    return result;
}

void MigrationOrchestrator::waitForAll() {
    taskManager_->waitForAll();
}

void MigrationOrchestrator::runMigration(const std::shared_ptr<MigrationJob>& job) {
    RunState run;
    try {
        executePhases(job, run);
    } catch (const std::exception& e) {
        MigrationPhase phase = job->getPhase();
        MigrationError kind = MigrationError::LifecycleFailure;
        if (phase == MigrationPhase::Transferring || phase == MigrationPhase::TransferringWorkspace) {
            kind = MigrationError::TransferFailure;
        } else if (phase == MigrationPhase::Verifying) {
            kind = MigrationError::VerificationTimeout;
        }
        abort(job, run, kind, describeFailure(kind, e.what()));
    }
}

bool MigrationOrchestrator::enterPhase(const std::shared_ptr<MigrationJob>& job, RunState& run,
                                       MigrationPhase phase) {
    if (job->isCancelRequested()) {
        Logger::info("Migration " + job->getTransferId() + " cancelled before " + phaseToString(phase));
        abort(job, run, MigrationError::Cancelled, describeFailure(MigrationError::Cancelled, ""));
        return false;
    }

    JobEvent event;
    if (!job->advanceTo(phase, event)) {
        abort(job, run, MigrationError::LifecycleFailure,
              describeFailure(MigrationError::LifecycleFailure,
                              "invalid transition " + phaseToString(job->getPhase()) + " -> " + phaseToString(phase)));
        return false;
    }

    Logger::info("Migration " + job->getTransferId() + " of " + job->getContainerId() + ": " + phaseToString(phase));
    publish(event);
    return true;
}

bool MigrationOrchestrator::executePhases(const std::shared_ptr<MigrationJob>& job, RunState& run) {
    const std::string& containerId = job->getContainerId();
    const std::string& sourceHost = job->getSourceHostId();
    const std::string& targetHost = job->getTargetHostId();
    std::string error;

    // stopping (the job starts in this phase)
    if (job->isCancelRequested()) {
        abort(job, run, MigrationError::Cancelled, describeFailure(MigrationError::Cancelled, ""));
        return false;
    }
    Logger::info("Migration " + job->getTransferId() + " of " + containerId + ": stopping on " + sourceHost);
    if (!lifecycle_->stop(containerId, sourceHost, error)) {
        abort(job, run, MigrationError::LifecycleFailure,
              describeFailure(MigrationError::LifecycleFailure, "stop failed: " + error));
        return false;
    }
    run.sourceStopped = true;

    if (!enterPhase(job, run, MigrationPhase::Exporting)) {
        return false;
    }
    if (!lifecycle_->exportArtifact(containerId, sourceHost, ArtifactKind::Image, run.image, error)) {
        abort(job, run, MigrationError::LifecycleFailure,
              describeFailure(MigrationError::LifecycleFailure, "image export failed: " + error));
        return false;
    }
    run.imageExported = true;
    if (run.image.sizeBytes == 0) {
        abort(job, run, MigrationError::LifecycleFailure,
              describeFailure(MigrationError::LifecycleFailure, "exported image is empty"));
        return false;
    }
    if (!lifecycle_->exportArtifact(containerId, sourceHost, ArtifactKind::Workspace, run.workspace, error)) {
        abort(job, run, MigrationError::LifecycleFailure,
              describeFailure(MigrationError::LifecycleFailure, "workspace export failed: " + error));
        return false;
    }
    run.workspaceExported = run.workspace.sizeBytes > 0;
    job->setTotalBytes(run.image.sizeBytes + run.workspace.sizeBytes);
    Logger::info("Migration " + job->getTransferId() + ": image " + formatBytes(static_cast<double>(run.image.sizeBytes)) +
                 ", workspace " + formatBytes(static_cast<double>(run.workspace.sizeBytes)));

    if (!enterPhase(job, run, MigrationPhase::Transferring)) {
        return false;
    }
    job->resetMeter(MigrationJob::Clock::now());
    if (!transferArtifact(job, run.image, 0, run.deliveredImage, error)) {
        abort(job, run, MigrationError::TransferFailure,
              describeFailure(MigrationError::TransferFailure, "image transfer failed: " + error));
        return false;
    }
    run.imageDelivered = true;

    if (!enterPhase(job, run, MigrationPhase::TransferringWorkspace)) {
        return false;
    }
    if (run.workspace.sizeBytes > 0) {
        if (!transferArtifact(job, run.workspace, run.image.sizeBytes, run.deliveredWorkspace, error)) {
            abort(job, run, MigrationError::TransferFailure,
                  describeFailure(MigrationError::TransferFailure, "workspace transfer failed: " + error));
            return false;
        }
        run.workspaceDelivered = true;
    }

    if (!enterPhase(job, run, MigrationPhase::Importing)) {
        return false;
    }
    if (!lifecycle_->importArtifact(targetHost, run.deliveredImage, error)) {
        abort(job, run, MigrationError::LifecycleFailure,
              describeFailure(MigrationError::LifecycleFailure, "image import failed: " + error));
        return false;
    }

    if (!enterPhase(job, run, MigrationPhase::ImportingWorkspace)) {
        return false;
    }
    if (run.workspaceDelivered && !lifecycle_->importArtifact(targetHost, run.deliveredWorkspace, error)) {
        abort(job, run, MigrationError::LifecycleFailure,
              describeFailure(MigrationError::LifecycleFailure, "workspace import failed: " + error));
        return false;
    }

    if (!enterPhase(job, run, MigrationPhase::Starting)) {
        return false;
    }
    if (!lifecycle_->start(containerId, targetHost, error)) {
        abort(job, run, MigrationError::LifecycleFailure,
              describeFailure(MigrationError::LifecycleFailure, "start on " + targetHost + " failed: " + error));
        return false;
    }
    run.targetStarted = true;

    if (!enterPhase(job, run, MigrationPhase::Verifying)) {
        return false;
    }
    if (!lifecycle_->verifyRunning(containerId, targetHost, std::chrono::seconds(config_.verifyTimeoutSeconds), error)) {
        abort(job, run, MigrationError::VerificationTimeout,
              describeFailure(MigrationError::VerificationTimeout,
                              containerId + " not running on " + targetHost + " after " +
                              std::to_string(config_.verifyTimeoutSeconds) + "s: " + error));
        return false;
    }

    finish(job, run);
    return true;
}

bool MigrationOrchestrator::transferArtifact(const std::shared_ptr<MigrationJob>& job, const Artifact& artifact,
                                             uint64_t baseBytes, Artifact& delivered, std::string& error) {
    const uint64_t size = artifact.sizeBytes;
    auto onChunk = [this, &job, baseBytes, size](uint64_t acknowledged) {
        JobEvent event;
        uint64_t bytes = baseBytes + std::min(acknowledged, size);
        if (job->updateBytesTransferred(bytes, MigrationJob::Clock::now(), event)) {
            Logger::debug("Migration " + job->getTransferId() + ": " + std::to_string(bytes) + "/" +
                          std::to_string(event.totalBytes) + " bytes");
            publish(event);
        }
    };

    Logger::info("Sending " + artifactKindToString(artifact.kind) + " of " + job->getContainerId() + " to " +
                 job->getTargetHostId());
    if (!transport_->send(artifact, job->getTargetHostId(), delivered, onChunk, error)) {
        return false;
    }

    // The transport may not report the last chunk separately
    onChunk(size);
    return true;
}

void MigrationOrchestrator::finish(const std::shared_ptr<MigrationJob>& job, RunState& run) {
    const std::string containerId = job->getContainerId();
    const std::string targetHost = job->getTargetHostId();

    if (job->isCancelRequested()) {
        Logger::info("Migration " + job->getTransferId() + " cancelled before complete");
        abort(job, run, MigrationError::Cancelled, describeFailure(MigrationError::Cancelled, ""));
        return;
    }

    JobEvent event;
    bool relocated = false;
    bool completed = job->complete([&]() {
        relocated = inventory_->relocate(containerId, targetHost);
    }, event);

    if (!completed) {
        abort(job, run, MigrationError::LifecycleFailure,
              describeFailure(MigrationError::LifecycleFailure, "job left verifying unexpectedly"));
        return;
    }
    if (!relocated) {
        Logger::error("Migration " + job->getTransferId() + " complete but inventory not updated: " +
                      inventory_->getLastError());
    }

    Logger::info("Migration " + job->getTransferId() + " of " + containerId + " complete on " + targetHost);
    publish(event);

    removeStagedArtifacts(job, run);
    scheduleReap(job);
}

void MigrationOrchestrator::abort(const std::shared_ptr<MigrationJob>& job, RunState& run,
                                  MigrationError kind, const std::string& message) {
    if (job->isTerminal()) {
        return;
    }

    if (!run.targetStarted) {
        try {
            cleanupAfterAbort(job, run);
        } catch (const std::exception& e) {
            Logger::error("Cleanup of migration " + job->getTransferId() + " failed: " + e.what());
            inventory_->setStatus(job->getContainerId(), run.sourceStopped ? "stopped" : "running");
        }
    } else {
        // The container may be running on the target; leave it there for inspection
        Logger::warning("Migration " + job->getTransferId() + " failed after start on " + job->getTargetHostId() +
                        "; destination left in place");
        inventory_->setStatus(job->getContainerId(), "unknown");
    }

    JobEvent event;
    if (job->fail(kind, message, event)) {
        Logger::error("Migration " + job->getTransferId() + " of " + job->getContainerId() + " failed: " + message);
        publish(event);
    }
}

void MigrationOrchestrator::cleanupAfterAbort(const std::shared_ptr<MigrationJob>& job, RunState& run) {
    removeStagedArtifacts(job, run);

    const std::string& containerId = job->getContainerId();
    if (!run.sourceStopped) {
        inventory_->setStatus(containerId, "running");
        return;
    }

    if (config_.restartSourceOnAbort) {
        std::string error;
        if (lifecycle_->start(containerId, job->getSourceHostId(), error)) {
            Logger::info("Restarted " + containerId + " on source " + job->getSourceHostId());
            inventory_->setStatus(containerId, "running");
            return;
        }
        Logger::error("Failed to restart " + containerId + " on source: " + error);
    }
    inventory_->setStatus(containerId, "stopped");
}

void MigrationOrchestrator::removeStagedArtifacts(const std::shared_ptr<MigrationJob>& job, RunState& run) {
    const std::string& targetHost = job->getTargetHostId();
    const std::string& sourceHost = job->getSourceHostId();
    std::string error;

    // Partial copies may exist on the target even when send() failed
    if (run.imageExported) {
        Artifact copy = run.imageDelivered ? run.deliveredImage : run.image;
        copy.hostId = targetHost;
        if (!transport_->remove(targetHost, copy, error)) {
            Logger::warning("Could not remove image copy on " + targetHost + ": " + error);
        }
        if (!lifecycle_->removeArtifact(sourceHost, run.image, error)) {
            Logger::warning("Could not remove image export on " + sourceHost + ": " + error);
        }
    }
    if (run.workspaceExported) {
        Artifact copy = run.workspaceDelivered ? run.deliveredWorkspace : run.workspace;
        copy.hostId = targetHost;
        if (!transport_->remove(targetHost, copy, error)) {
            Logger::warning("Could not remove workspace copy on " + targetHost + ": " + error);
        }
        if (!lifecycle_->removeArtifact(sourceHost, run.workspace, error)) {
            Logger::warning("Could not remove workspace export on " + sourceHost + ": " + error);
        }
    }
}

void MigrationOrchestrator::scheduleReap(const std::shared_ptr<MigrationJob>& job) {
    auto store = store_;
    std::string containerId = job->getContainerId();
    std::string transferId = job->getTransferId();

    if (config_.completedJobGraceSeconds <= 0) {
        store->removeJob(containerId, transferId);
        return;
    }

    scheduler_.scheduleTask("reap:" + transferId, std::chrono::seconds(config_.completedJobGraceSeconds),
        [store, containerId, transferId]() {
            if (store->removeJob(containerId, transferId)) {
                Logger::debug("Reaped completed migration " + transferId + " of " + containerId);
            }
        });
}

void MigrationOrchestrator::housekeeping() {
    reportStalledJobs();

    // Backstop for completed jobs that missed their reap task
    size_t removed = store_->cleanupCompletedJobs(MigrationJob::Clock::now(),
                                                  std::chrono::seconds(config_.completedJobGraceSeconds));
    if (removed > 0) {
        Logger::debug("Swept " + std::to_string(removed) + " completed migrations");
    }
}

void MigrationOrchestrator::reportStalledJobs() {
    if (config_.stallThresholdSeconds <= 0) {
        return;
    }
    auto now = MigrationJob::Clock::now();
    auto threshold = std::chrono::seconds(config_.stallThresholdSeconds);
    for (const auto& job : store_->getJobs()) {
        if (job->isStalled(now, threshold)) {
            Logger::warning("Migration " + job->getTransferId() + " of " + job->getContainerId() +
                            " has made no progress in " + phaseToString(job->getPhase()) +
                            " for over " + std::to_string(config_.stallThresholdSeconds) + "s");
        }
    }
}
