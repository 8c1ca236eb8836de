#include "migration/migration_status.hpp"

std::string phaseToString(MigrationPhase phase) {
    switch (phase) {
        case MigrationPhase::Stopping:              return "stopping";
        case MigrationPhase::Exporting:             return "exporting";
        case MigrationPhase::Transferring:          return "transferring";
        case MigrationPhase::TransferringWorkspace: return "transferring_workspace";
        case MigrationPhase::Importing:             return "importing";
        case MigrationPhase::ImportingWorkspace:    return "importing_workspace";
        case MigrationPhase::Starting:              return "starting";
        case MigrationPhase::Verifying:             return "verifying";
        case MigrationPhase::Complete:              return "complete";
        case MigrationPhase::Failed:                return "failed";
    }
    return "unknown";
}

bool phaseFromString(const std::string& name, MigrationPhase& phase) {
    static const MigrationPhase all[] = {
        MigrationPhase::Stopping, MigrationPhase::Exporting, MigrationPhase::Transferring,
        MigrationPhase::TransferringWorkspace, MigrationPhase::Importing,
        MigrationPhase::ImportingWorkspace, MigrationPhase::Starting,
        MigrationPhase::Verifying, MigrationPhase::Complete, MigrationPhase::Failed
    };
    for (auto candidate : all) {
        if (phaseToString(candidate) == name) {
            phase = candidate;
            return true;
        }
    }
    return false;
}

std::string errorToString(MigrationError error) {
    switch (error) {
        case MigrationError::None:                return "None";
        case MigrationError::AlreadyInProgress:   return "AlreadyInProgress";
        case MigrationError::InvalidTarget:       return "InvalidTarget";
        case MigrationError::NotFound:            return "NotFound";
        case MigrationError::NotCancellable:      return "NotCancellable";
        case MigrationError::LifecycleFailure:    return "LifecycleFailure";
        case MigrationError::TransferFailure:     return "TransferFailure";
        case MigrationError::VerificationTimeout: return "VerificationTimeout";
        case MigrationError::Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

std::string artifactKindToString(ArtifactKind kind) {
    return kind == ArtifactKind::Image ? "image" : "workspace";
}

bool isTerminalPhase(MigrationPhase phase) {
    return phase == MigrationPhase::Complete || phase == MigrationPhase::Failed;
}

MigrationPhase nextPhase(MigrationPhase phase) {
    switch (phase) {
        case MigrationPhase::Stopping:              return MigrationPhase::Exporting;
        case MigrationPhase::Exporting:             return MigrationPhase::Transferring;
        case MigrationPhase::Transferring:          return MigrationPhase::TransferringWorkspace;
        case MigrationPhase::TransferringWorkspace: return MigrationPhase::Importing;
        case MigrationPhase::Importing:             return MigrationPhase::ImportingWorkspace;
        case MigrationPhase::ImportingWorkspace:    return MigrationPhase::Starting;
        case MigrationPhase::Starting:              return MigrationPhase::Verifying;
        case MigrationPhase::Verifying:             return MigrationPhase::Complete;
        case MigrationPhase::Complete:              return MigrationPhase::Complete;
        case MigrationPhase::Failed:                return MigrationPhase::Failed;
    }
    return MigrationPhase::Failed;
}

bool isValidTransition(MigrationPhase from, MigrationPhase to) {
    if (isTerminalPhase(from)) {
        return false;
    }
    if (to == MigrationPhase::Failed) {
        return true;
    }
    return nextPhase(from) == to;
}
