#include "migration/container_inventory.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

ContainerInventory::ContainerInventory(const std::string& path)
    : path_(path) {
}

bool ContainerInventory::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty()) {
        return true;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        lastError_ = "Failed to open inventory file: " + path_;
        return false;
    }

    try {
        json root;
        file >> root;
        std::unordered_map<std::string, ContainerRecord> loaded;
        for (const auto& entry : root.at("containers")) {
            ContainerRecord record;
            record.id = entry.at("id").get<std::string>();
            record.hostId = entry.at("hostId").get<std::string>();
            record.status = entry.value("status", std::string("unknown"));
            loaded[record.id] = record;
        }
        containers_.swap(loaded);
        Logger::debug("Loaded " + std::to_string(containers_.size()) + " containers from " + path_);
        return true;
    } catch (const json::exception& e) {
        lastError_ = "Failed to read inventory " + path_ + ": " + e.what();
        return false;
    }
}

bool ContainerInventory::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveLocked();
}

bool ContainerInventory::saveLocked() const {
    if (path_.empty()) {
        return true;
    }

    std::vector<ContainerRecord> records;
    for (const auto& pair : containers_) {
        records.push_back(pair.second);
    }
    std::sort(records.begin(), records.end(),
              [](const ContainerRecord& a, const ContainerRecord& b) { return a.id < b.id; });

    json root;
    root["containers"] = json::array();
    for (const auto& record : records) {
        root["containers"].push_back({
            {"id", record.id},
            {"hostId", record.hostId},
            {"status", record.status}
        });
    }

    try {
        std::filesystem::path target(path_);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }
        // Write then rename so readers never see a half-written file
        std::string tmpPath = path_ + ".tmp";
        {
            std::ofstream file(tmpPath, std::ios::trunc);
            if (!file.is_open()) {
                lastError_ = "Failed to open inventory file for writing: " + tmpPath;
                return false;
            }
            file << root.dump(4);
        }
        std::filesystem::rename(tmpPath, target);
        return true;
    } catch (const std::exception& e) {
        lastError_ = "Failed to write inventory " + path_ + ": " + e.what();
        return false;
    }
}

bool ContainerInventory::getContainer(const std::string& containerId, ContainerRecord& record) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = containers_.find(containerId);
    if (it == containers_.end()) {
        return false;
    }
    record = it->second;
    return true;
}

std::vector<ContainerRecord> ContainerInventory::listContainers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ContainerRecord> records;
    records.reserve(containers_.size());
    for (const auto& pair : containers_) {
        records.push_back(pair.second);
    }
    return records;
}

void ContainerInventory::upsert(const ContainerRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    containers_[record.id] = record;
    if (!saveLocked()) {
        Logger::error(lastError_);
    }
}

bool ContainerInventory::setStatus(const std::string& containerId, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = containers_.find(containerId);
    if (it == containers_.end()) {
        lastError_ = "Unknown container: " + containerId;
        return false;
    }
    it->second.status = status;
    if (!saveLocked()) {
        Logger::error(lastError_);
    }
    return true;
}

bool ContainerInventory::relocate(const std::string& containerId, const std::string& hostId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = containers_.find(containerId);
    if (it == containers_.end()) {
        lastError_ = "Unknown container: " + containerId;
        return false;
    }
    it->second.hostId = hostId;
    it->second.status = "running";
    if (!saveLocked()) {
        Logger::error(lastError_);
    }
    return true;
}

std::string ContainerInventory::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}
