#include "migration/registry/static_host_registry.hpp"

StaticHostRegistry::StaticHostRegistry(const std::string& localHostId, const std::vector<HostConfig>& hosts)
    : HostRegistry(localHostId) {
    for (const auto& host : hosts) {
        hosts_.push_back({host.id, host.name, host.address, host.online});
    }
}

bool StaticHostRegistry::listHosts(std::vector<HostInfo>& hosts) {
    std::lock_guard<std::mutex> lock(mutex_);
    hosts = hosts_;
    return true;
}

void StaticHostRegistry::addHost(const HostInfo& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& existing : hosts_) {
        if (existing.id == host.id) {
            existing = host;
            return;
        }
    }
    hosts_.push_back(host);
}

bool StaticHostRegistry::setOnline(const std::string& hostId, bool online) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& host : hosts_) {
        if (host.id == hostId) {
            host.online = online;
            return true;
        }
    }
    return false;
}
