#include "migration/cancellation_controller.hpp"
#include "common/logger.hpp"

CancellationController::CancellationController(std::shared_ptr<MigrationJobStore> store)
    : store_(std::move(store)) {
}

MigrationError CancellationController::requestCancel(const std::string& containerId) {
    auto job = store_->getJob(containerId);
    if (!job) {
        return MigrationError::NotFound;
    }

    if (job->isCancelRequested() && !job->isTerminal()) {
        Logger::info("Migration " + job->getTransferId() + " of " + containerId + " is already being cancelled");
        return MigrationError::None;
    }

    if (!job->requestCancel()) {
        return MigrationError::NotCancellable;
    }

    Logger::info("Cancel requested for migration " + job->getTransferId() + " of " + containerId +
                 " (phase " + phaseToString(job->getPhase()) + ")");
    return MigrationError::None;
}
