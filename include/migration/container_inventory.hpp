#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>

struct ContainerRecord {
    std::string id;
    std::string hostId;    // Current location
    std::string status;    // "running", "stopped", "migrating", "unknown"
};

// Known containers and where they run. When a path is set, every change is
// written back as JSON ({"containers": [{"id", "hostId", "status"}]}).
class ContainerInventory {
public:
    ContainerInventory() = default;
    explicit ContainerInventory(const std::string& path);

    bool load();
    bool save() const;

    bool getContainer(const std::string& containerId, ContainerRecord& record) const;
    std::vector<ContainerRecord> listContainers() const;

    void upsert(const ContainerRecord& record);
    bool setStatus(const std::string& containerId, const std::string& status);

    // Moves the container to hostId and marks it running
    bool relocate(const std::string& containerId, const std::string& hostId);

    std::string getLastError() const;

private:
    bool saveLocked() const;

    std::string path_;
    std::unordered_map<std::string, ContainerRecord> containers_;
    mutable std::string lastError_;
    mutable std::mutex mutex_;
};
