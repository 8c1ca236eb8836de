#pragma once

#include "migration/artifact_transport.hpp"
#include "migration/container_lifecycle.hpp"
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// Records every call as "<op>:<subject>@<host>" and fails on demand
class FakeContainerLifecycle : public ContainerLifecycle {
public:
    uint64_t imageSize{1000000};
    uint64_t workspaceSize{0};
    bool failStop{false};
    bool failExport{false};
    bool failImport{false};
    std::string failStartOn;
    bool failVerify{false};
    std::string throwOn;   // Operation ("stop", "export", ...) that throws std::runtime_error

    // Runs on the worker thread before each operation
    std::function<void(const std::string& call)> onCall;

    bool stop(const std::string& containerId, const std::string& hostId, std::string& error) override {
        record("stop", "stop:" + containerId + "@" + hostId);
        return check(!failStop, containerId + ": stop refused", error);
    }

    bool start(const std::string& containerId, const std::string& hostId, std::string& error) override {
        record("start", "start:" + containerId + "@" + hostId);
        return check(failStartOn != hostId, containerId + ": start refused", error);
    }

    bool exportArtifact(const std::string& containerId, const std::string& hostId,
                        ArtifactKind kind, Artifact& artifact, std::string& error) override {
        record("export", "export:" + artifactKindToString(kind) + "@" + hostId);
        if (failExport) {
            return check(false, containerId + ": export refused", error);
        }
        artifact = Artifact();
        artifact.kind = kind;
        artifact.containerId = containerId;
        artifact.hostId = hostId;
        artifact.sizeBytes = kind == ArtifactKind::Image ? imageSize : workspaceSize;
        if (artifact.sizeBytes > 0) {
            artifact.path = containerId + "." + artifactKindToString(kind) + ".tar.gz";
        }
        return true;
    }

    bool importArtifact(const std::string& hostId, const Artifact& artifact, std::string& error) override {
        record("import", "import:" + artifactKindToString(artifact.kind) + "@" + hostId);
        return check(!failImport, artifact.containerId + ": import refused", error);
    }

    bool verifyRunning(const std::string& containerId, const std::string& hostId,
                       std::chrono::milliseconds, std::string& error) override {
        record("verify", "verify:" + containerId + "@" + hostId);
        return check(!failVerify, containerId + ": not running", error);
    }

    bool removeArtifact(const std::string& hostId, const Artifact& artifact, std::string&) override {
        record("remove", "remove:" + artifactKindToString(artifact.kind) + "@" + hostId);
        return true;
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    bool called(const std::string& call) const {
        for (const auto& entry : calls()) {
            if (entry == call) {
                return true;
            }
        }
        return false;
    }

private:
    void record(const std::string& op, const std::string& call) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(call);
        }
        if (onCall) {
            onCall(call);
        }
        if (op == throwOn) {
            throw std::runtime_error(op + " crashed");
        }
    }

    static bool check(bool ok, const std::string& message, std::string& error) {
        if (!ok) {
            error = message;
        }
        return ok;
    }

    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
};

// Acknowledges each artifact in the configured steps
class FakeArtifactTransport : public ArtifactTransport {
public:
    std::vector<uint64_t> imageChunks;       // Empty: one ack of the full size
    std::vector<uint64_t> workspaceChunks;
    bool failImage{false};
    bool failWorkspace{false};
    bool throwOnImage{false};

    // Runs on the worker thread after the chunks were acknowledged
    std::function<void(const Artifact&)> onSend;

    bool send(const Artifact& artifact, const std::string& targetHostId,
              Artifact& delivered, const ChunkCallback& onChunk, std::string& error) override {
        bool image = artifact.kind == ArtifactKind::Image;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sends_.push_back(artifactKindToString(artifact.kind) + "@" + targetHostId);
        }

        std::vector<uint64_t> chunks = image ? imageChunks : workspaceChunks;
        if (chunks.empty()) {
            chunks.push_back(artifact.sizeBytes);
        }
        for (uint64_t acked : chunks) {
            onChunk(acked);
        }
        if (onSend) {
            onSend(artifact);
        }
        if (image && throwOnImage) {
            throw std::runtime_error("socket closed");
        }
        if ((image && failImage) || (!image && failWorkspace)) {
            error = artifact.containerId + ": connection reset";
            return false;
        }
        delivered = artifact;
        delivered.hostId = targetHostId;
        return true;
    }

    bool remove(const std::string& hostId, const Artifact& artifact, std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        removes_.push_back(artifactKindToString(artifact.kind) + "@" + hostId);
        return true;
    }

    std::vector<std::string> sends() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sends_;
    }

    std::vector<std::string> removes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removes_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> sends_;
    std::vector<std::string> removes_;
};
