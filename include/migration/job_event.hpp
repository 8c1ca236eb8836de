#pragma once

#include "migration/migration_status.hpp"
#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

// Event name understood by the presentation layer
constexpr const char* kMigrationProgressEvent = "migration:progress";

// One state change of a migration job. Consumers keep the latest event per
// containerId; a later event always supersedes an earlier one.
struct JobEvent {
    std::string containerId;
    std::string transferId;
    MigrationPhase phase{MigrationPhase::Stopping};
    int progressPct{0};
    uint64_t bytesTransferred{0};
    uint64_t totalBytes{0};
    std::optional<std::string> error;
};

// Wire payload: {appId, phase, progressPct, bytesTransferred, totalBytes, error}
nlohmann::json toJson(const JobEvent& event);

// {"event": "migration:progress", "data": {...}}
nlohmann::json toEnvelope(const JobEvent& event);

// Parses a wire payload back into an event; false on malformed input
bool fromJson(const nlohmann::json& payload, JobEvent& event);
