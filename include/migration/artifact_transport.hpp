#pragma once

#include "migration/migration_status.hpp"
#include <functional>
#include <string>
#include <cstdint>

// Called after each chunk the destination acknowledged, with the cumulative
// number of bytes of this artifact received so far
using ChunkCallback = std::function<void(uint64_t bytesAcknowledged)>;

// Reliable byte stream between host staging areas
class ArtifactTransport {
public:
    virtual ~ArtifactTransport() = default;

    // Copy artifact (staged on artifact.hostId) to targetHostId. On success
    // delivered describes the copy on the target; on failure error says why.
    virtual bool send(const Artifact& artifact, const std::string& targetHostId,
                      Artifact& delivered, const ChunkCallback& onChunk, std::string& error) = 0;

    // Delete a delivered or partial copy from hostId
    virtual bool remove(const std::string& hostId, const Artifact& artifact, std::string& error) = 0;
};
