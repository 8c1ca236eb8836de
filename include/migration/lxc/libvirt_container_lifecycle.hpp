#pragma once

#include "common/migration_config.hpp"
#include "migration/container_lifecycle.hpp"
#include "migration/host_registry.hpp"
#include <libvirt/libvirt.h>
#include <functional>
#include <memory>
#include <string>

// libvirt-lxc containers. Domain state goes through the libvirt API; file
// system snapshots are tar archives made by shell commands, run locally or
// over ssh on remote hosts.
class LibvirtContainerLifecycle : public ContainerLifecycle {
public:
    // Runs a shell command, stores its stdout and returns the exit status
    using CommandRunner = std::function<int(const std::string& command, std::string& output)>;

    LibvirtContainerLifecycle(const MigrationConfig& config,
                              std::shared_ptr<HostRegistry> registry,
                              CommandRunner runner = CommandRunner());

    bool stop(const std::string& containerId, const std::string& hostId, std::string& error) override;
    bool start(const std::string& containerId, const std::string& hostId, std::string& error) override;
    bool exportArtifact(const std::string& containerId, const std::string& hostId,
                        ArtifactKind kind, Artifact& artifact, std::string& error) override;
    bool importArtifact(const std::string& hostId, const Artifact& artifact, std::string& error) override;
    bool verifyRunning(const std::string& containerId, const std::string& hostId,
                       std::chrono::milliseconds timeout, std::string& error) override;
    bool removeArtifact(const std::string& hostId, const Artifact& artifact, std::string& error) override;

    static std::string buildArchiveCommand(const std::string& sourceDir, const std::string& archivePath);
    static std::string buildExtractCommand(const std::string& archivePath, const std::string& targetDir);
    static std::string buildRemoteCommand(const std::string& address, const std::string& command);
    static std::string artifactFileName(const std::string& containerId, ArtifactKind kind);

    // Directory holding staged artifacts, as seen from hostId itself
    std::string stagingDirFor(const std::string& hostId) const;
    std::string connectionUri(const std::string& hostId, const std::string& address) const;

    static constexpr int kStopTimeoutSeconds = 30;

private:
    struct ConnectionDeleter {
        void operator()(virConnectPtr conn) const { virConnectClose(conn); }
    };
    struct DomainDeleter {
        void operator()(virDomainPtr domain) const { virDomainFree(domain); }
    };
    using Connection = std::unique_ptr<virConnect, ConnectionDeleter>;
    using Domain = std::unique_ptr<virDomain, DomainDeleter>;

    Connection connect(const std::string& hostId, std::string& error);
    Domain lookupDomain(virConnectPtr conn, const std::string& containerId, std::string& error);
    bool getDomainState(virDomainPtr domain, int& state, std::string& error);

    // Runs command on hostId; non-local hosts go through ssh
    int runOnHost(const std::string& hostId, const std::string& command, std::string& output, std::string& error);
    bool fileSize(const std::string& hostId, const std::string& path, uint64_t& size, std::string& error);
    bool fileChecksum(const std::string& hostId, const std::string& path, std::string& checksum,
                      std::string& error);

    MigrationConfig config_;
    std::shared_ptr<HostRegistry> registry_;
    CommandRunner runner_;
};
