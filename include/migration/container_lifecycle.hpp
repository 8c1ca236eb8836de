#pragma once

#include "migration/migration_status.hpp"
#include <string>
#include <chrono>

// Runtime operations on a container. All calls block until the runtime has
// confirmed the result. A failed call describes the cause in error; one
// instance serves every concurrent migration.
class ContainerLifecycle {
public:
    virtual ~ContainerLifecycle() = default;

    virtual bool stop(const std::string& containerId, const std::string& hostId, std::string& error) = 0;
    virtual bool start(const std::string& containerId, const std::string& hostId, std::string& error) = 0;

    // Snapshot the container image or its workspace into the staging area of
    // hostId. A container without a workspace yields a zero-size artifact.
    virtual bool exportArtifact(const std::string& containerId, const std::string& hostId,
                                ArtifactKind kind, Artifact& artifact, std::string& error) = 0;

    // Apply an artifact already delivered to the staging area of hostId
    virtual bool importArtifact(const std::string& hostId, const Artifact& artifact, std::string& error) = 0;

    // Wait until the container reports running on hostId
    virtual bool verifyRunning(const std::string& containerId, const std::string& hostId,
                               std::chrono::milliseconds timeout, std::string& error) = 0;

    // Delete a staged artifact from hostId (best effort cleanup)
    virtual bool removeArtifact(const std::string& hostId, const Artifact& artifact, std::string& error) = 0;
};
