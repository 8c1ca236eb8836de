#pragma once

#include <string>
#include <vector>

// A host entry as listed in the config file (static registry)
struct HostConfig {
    std::string id;
    std::string name;
    std::string address;   // Hostname or IP used to reach the host
    bool online{true};
};

// Where host online/offline facts come from
struct RegistryConfig {
    std::string type{"static"};   // "static" or "http"
    std::string url;              // Base URL of the registry API for "http"
    std::string apiToken;         // Optional bearer token for "http"
    int timeoutSeconds{5};
};

// Configuration for the migration engine
struct MigrationConfig {
    // Logging
    std::string logPath{"/tmp/liveshift.log"};
    std::string logLevel{"info"};

    // Engine behaviour
    std::string localHostId{"local"};
    int maxConcurrentMigrations{4};
    int verifyTimeoutSeconds{60};
    int verifyPollMillis{500};
    int completedJobGraceSeconds{5};
    int stallThresholdSeconds{120};
    int subscriberQueueDepth{256};
    bool restartSourceOnAbort{true};

    // Transfer
    size_t chunkSizeBytes{64 * 1024};
    bool verifyChecksums{true};

    // Storage layout
    std::string stagingRoot{"/var/lib/liveshift/staging"};   // <stagingRoot>/<hostId>/... as seen locally
    std::string hostStagingDir{"/var/lib/liveshift/outbox"}; // Staging directory on each remote host
    std::string containerRoot{"/var/lib/lxc"};               // <containerRoot>/<id>/rootfs
    std::string workspaceRoot{"/var/lib/liveshift/workspaces"};
    std::string inventoryPath{"/var/lib/liveshift/containers.json"};

    // libvirt connection URIs; {address} is replaced by the host address
    std::string localLibvirtUri{"lxc:///"};
    std::string remoteLibvirtUri{"lxc+ssh://root@{address}/"};

    RegistryConfig registry;
    std::vector<HostConfig> hosts;

    bool validate(std::string& error) const;
};

// Reads a JSON config file. Missing keys keep their defaults.
// Throws std::runtime_error if the file can't be read or parsed.
MigrationConfig loadMigrationConfig(const std::string& path);

// Parses config from a JSON document string
MigrationConfig parseMigrationConfig(const std::string& content);
