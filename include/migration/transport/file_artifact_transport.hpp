#pragma once

#include "migration/artifact_transport.hpp"
#include <string>

// Moves artifacts between host staging areas that are reachable as
// directories under one root: <stagingRoot>/<hostId>/<artifact.path>.
// Data is written to a ".part" file and renamed once complete, so the
// target never sees a truncated artifact under its final name.
class FileArtifactTransport : public ArtifactTransport {
public:
    FileArtifactTransport(const std::string& stagingRoot, size_t chunkSize, bool verifyChecksums);

    bool send(const Artifact& artifact, const std::string& targetHostId,
              Artifact& delivered, const ChunkCallback& onChunk, std::string& error) override;
    bool remove(const std::string& hostId, const Artifact& artifact, std::string& error) override;

    std::string stagingPath(const std::string& hostId, const std::string& relativePath) const;

    // Hex SHA-256 of a file
    static bool calculateChecksum(const std::string& filePath, std::string& checksum, std::string& error);

private:
    std::string stagingRoot_;
    size_t chunkSize_;
    bool verifyChecksums_;
};
