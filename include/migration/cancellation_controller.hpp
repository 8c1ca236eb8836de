#pragma once

#include "migration/job_store.hpp"
#include "migration/migration_status.hpp"
#include <memory>
#include <string>

// Accepts operator cancel requests. The request only raises the job's flag;
// the orchestrator acts on it at its next phase boundary.
class CancellationController {
public:
    explicit CancellationController(std::shared_ptr<MigrationJobStore> store);

    // None on success (also when a cancel was already pending), NotFound when
    // the container has no job, NotCancellable when the job already finished
    MigrationError requestCancel(const std::string& containerId);

private:
    std::shared_ptr<MigrationJobStore> store_;
};
