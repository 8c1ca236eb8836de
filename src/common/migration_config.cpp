#include "common/migration_config.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <set>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template<typename T>
void readField(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

} // namespace

bool MigrationConfig::validate(std::string& error) const {
    if (localHostId.empty()) {
        error = "localHostId must not be empty";
        return false;
    }
    if (maxConcurrentMigrations <= 0) {
        error = "maxConcurrentMigrations must be greater than 0";
        return false;
    }
    if (verifyTimeoutSeconds <= 0) {
        error = "verifyTimeoutSeconds must be greater than 0";
        return false;
    }
    if (verifyPollMillis <= 0) {
        error = "verifyPollMillis must be greater than 0";
        return false;
    }
    if (completedJobGraceSeconds < 0) {
        error = "completedJobGraceSeconds must not be negative";
        return false;
    }
    if (subscriberQueueDepth <= 0) {
        error = "subscriberQueueDepth must be greater than 0";
        return false;
    }
    if (chunkSizeBytes == 0) {
        error = "chunkSizeBytes must be greater than 0";
        return false;
    }
    if (stagingRoot.empty()) {
        error = "stagingRoot must not be empty";
        return false;
    }
    if (registry.type != "static" && registry.type != "http") {
        error = "registry.type must be \"static\" or \"http\"";
        return false;
    }
    if (registry.type == "http" && registry.url.empty()) {
        error = "registry.url is required for the http registry";
        return false;
    }

    std::set<std::string> ids;
    for (const auto& host : hosts) {
        if (host.id.empty()) {
            error = "Host entries require an id";
            return false;
        }
        if (host.id == localHostId || host.id == "local") {
            error = "Host id \"" + host.id + "\" is reserved for the local host";
            return false;
        }
        if (!ids.insert(host.id).second) {
            error = "Duplicate host id: " + host.id;
            return false;
        }
    }
    return true;
}

MigrationConfig parseMigrationConfig(const std::string& content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }

    MigrationConfig config;
    try {
        readField(root, "logPath", config.logPath);
        readField(root, "logLevel", config.logLevel);
        readField(root, "localHostId", config.localHostId);
        readField(root, "maxConcurrentMigrations", config.maxConcurrentMigrations);
        readField(root, "verifyTimeoutSeconds", config.verifyTimeoutSeconds);
        readField(root, "verifyPollMillis", config.verifyPollMillis);
        readField(root, "completedJobGraceSeconds", config.completedJobGraceSeconds);
        readField(root, "stallThresholdSeconds", config.stallThresholdSeconds);
        readField(root, "subscriberQueueDepth", config.subscriberQueueDepth);
        readField(root, "restartSourceOnAbort", config.restartSourceOnAbort);
        readField(root, "chunkSizeBytes", config.chunkSizeBytes);
        readField(root, "verifyChecksums", config.verifyChecksums);
        readField(root, "stagingRoot", config.stagingRoot);
        readField(root, "hostStagingDir", config.hostStagingDir);
        readField(root, "containerRoot", config.containerRoot);
        readField(root, "workspaceRoot", config.workspaceRoot);
        readField(root, "inventoryPath", config.inventoryPath);
        readField(root, "localLibvirtUri", config.localLibvirtUri);
        readField(root, "remoteLibvirtUri", config.remoteLibvirtUri);

        if (root.contains("registry")) {
            const auto& registry = root["registry"];
            readField(registry, "type", config.registry.type);
            readField(registry, "url", config.registry.url);
            readField(registry, "apiToken", config.registry.apiToken);
            readField(registry, "timeoutSeconds", config.registry.timeoutSeconds);
        }

        if (root.contains("hosts")) {
            for (const auto& entry : root["hosts"]) {
                HostConfig host;
                readField(entry, "id", host.id);
                readField(entry, "name", host.name);
                readField(entry, "address", host.address);
                readField(entry, "online", host.online);
                if (host.name.empty()) {
                    host.name = host.id;
                }
                config.hosts.push_back(host);
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    return config;
}

MigrationConfig loadMigrationConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    MigrationConfig config = parseMigrationConfig(buffer.str());

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid config " + path + ": " + error);
    }
    Logger::debug("Loaded config from " + path + " with " + std::to_string(config.hosts.size()) + " hosts");
    return config;
}
