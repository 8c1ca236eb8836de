#include "migration/job_event.hpp"

using json = nlohmann::json;

json toJson(const JobEvent& event) {
    json payload = {
        {"appId", event.containerId},
        {"phase", phaseToString(event.phase)},
        {"progressPct", event.progressPct},
        {"bytesTransferred", event.bytesTransferred},
        {"totalBytes", event.totalBytes}
    };
    if (event.error) {
        payload["error"] = *event.error;
    } else {
        payload["error"] = nullptr;
    }
    return payload;
}

json toEnvelope(const JobEvent& event) {
    return {
        {"event", kMigrationProgressEvent},
        {"data", toJson(event)}
    };
}

bool fromJson(const json& payload, JobEvent& event) {
    try {
        if (!payload.is_object()) {
            return false;
        }
        JobEvent parsed;
        parsed.containerId = payload.at("appId").get<std::string>();
        if (!phaseFromString(payload.at("phase").get<std::string>(), parsed.phase)) {
            return false;
        }
        parsed.progressPct = payload.at("progressPct").get<int>();
        parsed.bytesTransferred = payload.at("bytesTransferred").get<uint64_t>();
        parsed.totalBytes = payload.at("totalBytes").get<uint64_t>();
        if (payload.contains("error") && payload["error"].is_string()) {
            parsed.error = payload["error"].get<std::string>();
        }
        event = parsed;
        return true;
    } catch (const json::exception&) {
        return false;
    }
}
