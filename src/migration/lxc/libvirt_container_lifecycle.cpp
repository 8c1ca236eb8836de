#include "migration/lxc/libvirt_container_lifecycle.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <libvirt/virterror.h>
#include <sys/wait.h>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <thread>

namespace {

int runShellCommand(const std::string& command, std::string& output) {
    output.clear();
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return -1;
    }
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        output += buffer;
    }
    int status = pclose(pipe);
    if (status == -1) {
        return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

std::string libvirtError() {
    const char* message = virGetLastErrorMessage();
    return message ? message : "unknown libvirt error";
}

// Single-quotes a shell word; embedded quotes become '\''
std::string quote(const std::string& word) {
    return "'" + utils::replaceAll(word, "'", "'\\''") + "'";
}

void reportError(std::string& error, const std::string& message) {
    error = message;
    Logger::error(message);
}

} // namespace

LibvirtContainerLifecycle::LibvirtContainerLifecycle(const MigrationConfig& config,
                                                     std::shared_ptr<HostRegistry> registry,
                                                     CommandRunner runner)
    : config_(config)
    , registry_(std::move(registry))
    , runner_(runner ? std::move(runner) : CommandRunner(runShellCommand)) {
}

std::string LibvirtContainerLifecycle::buildArchiveCommand(const std::string& sourceDir, const std::string& archivePath) {
    if (sourceDir.empty() || archivePath.empty()) {
        return {};
    }
    std::ostringstream command;
    command << "tar -czf " << quote(archivePath) << " -C " << quote(sourceDir) << " .";
    return command.str();
}

std::string LibvirtContainerLifecycle::buildExtractCommand(const std::string& archivePath, const std::string& targetDir) {
    if (archivePath.empty() || targetDir.empty()) {
        return {};
    }
    std::ostringstream command;
    command << "mkdir -p " << quote(targetDir) << " && tar -xzf " << quote(archivePath) << " -C " << quote(targetDir);
    return command.str();
}

std::string LibvirtContainerLifecycle::buildRemoteCommand(const std::string& address, const std::string& command) {
    return "ssh -o BatchMode=yes root@" + address + " " + quote(command);
}

std::string LibvirtContainerLifecycle::artifactFileName(const std::string& containerId, ArtifactKind kind) {
    return containerId + "." + artifactKindToString(kind) + ".tar.gz";
}

std::string LibvirtContainerLifecycle::stagingDirFor(const std::string& hostId) const {
    if (registry_->isLocal(hostId)) {
        return config_.stagingRoot + "/" + hostId;
    }
    return config_.hostStagingDir;
}

std::string LibvirtContainerLifecycle::connectionUri(const std::string& hostId, const std::string& address) const {
    if (registry_->isLocal(hostId)) {
        return config_.localLibvirtUri;
    }
    return utils::replaceAll(config_.remoteLibvirtUri, "{address}", address);
}

LibvirtContainerLifecycle::Connection LibvirtContainerLifecycle::connect(const std::string& hostId, std::string& error) {
    std::string address;
    if (!registry_->isLocal(hostId)) {
        HostInfo host;
        if (!registry_->findHost(hostId, host)) {
            reportError(error, "Unknown host: " + hostId);
            return Connection();
        }
        address = host.address;
    }

    std::string uri = connectionUri(hostId, address);
    Connection conn(virConnectOpenAuth(uri.c_str(), virConnectAuthPtrDefault, 0));
    if (!conn) {
        reportError(error, "Failed to connect to " + uri + ": " + libvirtError());
    }
    return conn;
}

LibvirtContainerLifecycle::Domain LibvirtContainerLifecycle::lookupDomain(virConnectPtr conn, const std::string& containerId,
                                                                        std::string& error) {
    Domain domain(virDomainLookupByName(conn, containerId.c_str()));
    if (!domain) {
        reportError(error, "Container " + containerId + " not found: " + libvirtError());
    }
    return domain;
}

bool LibvirtContainerLifecycle::getDomainState(virDomainPtr domain, int& state, std::string& error) {
    int reason = 0;
    if (virDomainGetState(domain, &state, &reason, 0) < 0) {
        reportError(error, "Failed to query domain state: " + libvirtError());
        return false;
    }
    return true;
}

int LibvirtContainerLifecycle::runOnHost(const std::string& hostId, const std::string& command, std::string& output,
                                         std::string& error) {
    if (registry_->isLocal(hostId)) {
        Logger::debug("Running: " + command);
        return runner_(command, output);
    }

    HostInfo host;
    if (!registry_->findHost(hostId, host)) {
        output.clear();
        reportError(error, "Unknown host: " + hostId);
        return -1;
    }
    std::string remote = buildRemoteCommand(host.address, command);
    Logger::debug("Running on " + hostId + ": " + command);
    return runner_(remote, output);
}

bool LibvirtContainerLifecycle::fileSize(const std::string& hostId, const std::string& path, uint64_t& size,
                                         std::string& error) {
    std::string output;
    if (runOnHost(hostId, "stat -c %s " + quote(path), output, error) != 0) {
        reportError(error, "Failed to stat " + path + " on " + hostId);
        return false;
    }
    try {
        size = std::stoull(output);
    } catch (const std::exception&) {
        reportError(error, "Unexpected stat output for " + path + ": " + output);
        return false;
    }
    return true;
}

bool LibvirtContainerLifecycle::fileChecksum(const std::string& hostId, const std::string& path, std::string& checksum,
                                             std::string& error) {
    std::string output;
    if (runOnHost(hostId, "sha256sum " + quote(path), output, error) != 0) {
        reportError(error, "Failed to checksum " + path + " on " + hostId);
        return false;
    }
    std::istringstream stream(output);
    stream >> checksum;
    return !checksum.empty();
}

bool LibvirtContainerLifecycle::stop(const std::string& containerId, const std::string& hostId, std::string& error) {
    Connection conn = connect(hostId, error);
    if (!conn) {
        return false;
    }
    Domain domain = lookupDomain(conn.get(), containerId, error);
    if (!domain) {
        return false;
    }

    int state = VIR_DOMAIN_NOSTATE;
    if (!getDomainState(domain.get(), state, error)) {
        return false;
    }
    if (state == VIR_DOMAIN_SHUTOFF) {
        Logger::info("Container " + containerId + " already stopped on " + hostId);
        return true;
    }

    if (virDomainShutdown(domain.get()) == 0) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(kStopTimeoutSeconds);
        while (std::chrono::steady_clock::now() < deadline) {
            if (!getDomainState(domain.get(), state, error)) {
                return false;
            }
            if (state == VIR_DOMAIN_SHUTOFF) {
                Logger::info("Container " + containerId + " stopped on " + hostId);
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.verifyPollMillis));
        }
        Logger::warning("Container " + containerId + " did not shut down in " +
                        std::to_string(kStopTimeoutSeconds) + "s, destroying");
    } else {
        Logger::warning("Graceful shutdown of " + containerId + " refused: " + libvirtError());
    }

    if (virDomainDestroy(domain.get()) < 0) {
        reportError(error, "Failed to stop " + containerId + " on " + hostId + ": " + libvirtError());
        return false;
    }
    Logger::info("Container " + containerId + " destroyed on " + hostId);
    return true;
}

bool LibvirtContainerLifecycle::start(const std::string& containerId, const std::string& hostId, std::string& error) {
    Connection conn = connect(hostId, error);
    if (!conn) {
        return false;
    }
    Domain domain = lookupDomain(conn.get(), containerId, error);
    if (!domain) {
        return false;
    }

    int state = VIR_DOMAIN_NOSTATE;
    if (getDomainState(domain.get(), state, error) && state == VIR_DOMAIN_RUNNING) {
        return true;
    }
    if (virDomainCreate(domain.get()) < 0) {
        reportError(error, "Failed to start " + containerId + " on " + hostId + ": " + libvirtError());
        return false;
    }
    Logger::info("Container " + containerId + " started on " + hostId);
    return true;
}

bool LibvirtContainerLifecycle::exportArtifact(const std::string& containerId, const std::string& hostId,
                                               ArtifactKind kind, Artifact& artifact, std::string& error) {
    artifact = Artifact();
    artifact.kind = kind;
    artifact.containerId = containerId;
    artifact.hostId = hostId;

    std::string sourceDir = kind == ArtifactKind::Image
        ? config_.containerRoot + "/" + containerId
        : config_.workspaceRoot + "/" + containerId;

    std::string output;
    if (kind == ArtifactKind::Workspace) {
        int rc = runOnHost(hostId, "test -d " + quote(sourceDir), output, error);
        if (rc == 1) {
            Logger::info("Container " + containerId + " has no workspace");
            return true;
        }
        if (rc != 0) {
            reportError(error, "Failed to inspect workspace of " + containerId + " on " + hostId);
            return false;
        }
    } else {
        Connection conn = connect(hostId, error);
        if (!conn) {
            return false;
        }
        Domain domain = lookupDomain(conn.get(), containerId, error);
        if (!domain) {
            return false;
        }
        char* xml = virDomainGetXMLDesc(domain.get(), 0);
        if (!xml) {
            reportError(error, "Failed to read definition of " + containerId + ": " + libvirtError());
            return false;
        }
        artifact.metadata = xml;
        free(xml);
    }

    std::string stagingDir = stagingDirFor(hostId);
    std::string fileName = artifactFileName(containerId, kind);
    std::string archivePath = stagingDir + "/" + fileName;
    std::string command = "mkdir -p " + quote(stagingDir) + " && " + buildArchiveCommand(sourceDir, archivePath);
    if (runOnHost(hostId, command, output, error) != 0) {
        reportError(error, "Failed to archive " + sourceDir + " on " + hostId);
        return false;
    }

    artifact.path = fileName;
    if (!fileSize(hostId, archivePath, artifact.sizeBytes, error)) {
        return false;
    }
    if (config_.verifyChecksums && !fileChecksum(hostId, archivePath, artifact.checksum, error)) {
        return false;
    }

    Logger::info("Exported " + artifactKindToString(kind) + " of " + containerId + " on " + hostId +
                 " (" + std::to_string(artifact.sizeBytes) + " bytes)");
    return true;
}

bool LibvirtContainerLifecycle::importArtifact(const std::string& hostId, const Artifact& artifact, std::string& error) {
    if (artifact.path.empty() || artifact.sizeBytes == 0) {
        return true;
    }

    std::string targetDir = artifact.kind == ArtifactKind::Image
        ? config_.containerRoot + "/" + artifact.containerId
        : config_.workspaceRoot + "/" + artifact.containerId;
    std::string archivePath = stagingDirFor(hostId) + "/" + artifact.path;

    std::string output;
    if (runOnHost(hostId, buildExtractCommand(archivePath, targetDir), output, error) != 0) {
        reportError(error, "Failed to extract " + artifact.path + " on " + hostId);
        return false;
    }

    if (artifact.kind == ArtifactKind::Image && !artifact.metadata.empty()) {
        Connection conn = connect(hostId, error);
        if (!conn) {
            return false;
        }
        Domain domain(virDomainDefineXML(conn.get(), artifact.metadata.c_str()));
        if (!domain) {
            reportError(error, "Failed to define " + artifact.containerId + " on " + hostId + ": " + libvirtError());
            return false;
        }
    }

    Logger::info("Imported " + artifactKindToString(artifact.kind) + " of " + artifact.containerId + " on " + hostId);
    return true;
}

bool LibvirtContainerLifecycle::verifyRunning(const std::string& containerId, const std::string& hostId,
                                              std::chrono::milliseconds timeout, std::string& error) {
    Connection conn = connect(hostId, error);
    if (!conn) {
        return false;
    }
    Domain domain = lookupDomain(conn.get(), containerId, error);
    if (!domain) {
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    int state = VIR_DOMAIN_NOSTATE;
    while (true) {
        if (getDomainState(domain.get(), state, error) && state == VIR_DOMAIN_RUNNING) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.verifyPollMillis));
    }
    reportError(error, "Container " + containerId + " not running on " + hostId + " (state " + std::to_string(state) + ")");
    return false;
}

bool LibvirtContainerLifecycle::removeArtifact(const std::string& hostId, const Artifact& artifact, std::string& error) {
    if (artifact.path.empty()) {
        return true;
    }
    std::string output;
    std::string archivePath = stagingDirFor(hostId) + "/" + artifact.path;
    if (runOnHost(hostId, "rm -f " + quote(archivePath), output, error) != 0) {
        reportError(error, "Failed to remove " + archivePath + " on " + hostId);
        return false;
    }
    return true;
}
