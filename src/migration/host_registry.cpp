#include "migration/host_registry.hpp"

bool HostRegistry::findHost(const std::string& hostId, HostInfo& host) {
    std::vector<HostInfo> hosts;
    if (!listHosts(hosts)) {
        return false;
    }
    for (const auto& candidate : hosts) {
        if (candidate.id == hostId) {
            host = candidate;
            return true;
        }
    }
    return false;
}

bool HostRegistry::isValidTarget(const std::string& hostId, std::string& reason) {
    if (hostId.empty()) {
        reason = "Target host is required";
        return false;
    }
    if (isLocal(hostId)) {
        return true;
    }

    std::vector<HostInfo> hosts;
    if (!listHosts(hosts)) {
        reason = "Host registry unavailable: " + getLastError();
        return false;
    }
    for (const auto& host : hosts) {
        if (host.id == hostId) {
            if (!host.online) {
                reason = "Target host " + hostId + " is offline";
                return false;
            }
            return true;
        }
    }
    reason = "Unknown target host: " + hostId;
    return false;
}
