#pragma once

#include <string>
#include <cstdint>

enum class MigrationPhase {
    Stopping,
    Exporting,
    Transferring,
    TransferringWorkspace,
    Importing,
    ImportingWorkspace,
    Starting,
    Verifying,
    Complete,
    Failed
};

// Rejections at start time and causes of a failed job
enum class MigrationError {
    None,
    AlreadyInProgress,
    InvalidTarget,
    NotFound,
    NotCancellable,
    LifecycleFailure,
    TransferFailure,
    VerificationTimeout,
    Cancelled
};

enum class ArtifactKind {
    Image,
    Workspace
};

// A transferable snapshot produced by the container lifecycle
struct Artifact {
    ArtifactKind kind{ArtifactKind::Image};
    std::string containerId;
    std::string hostId;       // Host whose staging area holds the file
    std::string path;         // File name relative to the host staging area
    uint64_t sizeBytes{0};
    std::string checksum;     // Hex SHA-256, filled by the transport when known
    std::string metadata;     // Runtime definition carried with the image (domain XML)
};

// Wire name used by the presentation layer ("transferring_workspace", ...)
std::string phaseToString(MigrationPhase phase);
bool phaseFromString(const std::string& name, MigrationPhase& phase);

std::string errorToString(MigrationError error);
std::string artifactKindToString(ArtifactKind kind);

bool isTerminalPhase(MigrationPhase phase);

// True when `to` may follow `from`: the next phase on the happy path, or
// Failed from any active phase
bool isValidTransition(MigrationPhase from, MigrationPhase to);

// Next phase on the happy path; Complete and Failed map to themselves
MigrationPhase nextPhase(MigrationPhase phase);
