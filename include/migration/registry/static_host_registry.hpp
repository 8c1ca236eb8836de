#pragma once

#include "migration/host_registry.hpp"
#include "common/migration_config.hpp"
#include <mutex>
#include <string>
#include <vector>

// Hosts listed in the config file. Online flags can be flipped at runtime.
class StaticHostRegistry : public HostRegistry {
public:
    StaticHostRegistry(const std::string& localHostId, const std::vector<HostConfig>& hosts);

    bool listHosts(std::vector<HostInfo>& hosts) override;
    std::string getLastError() const override { return ""; }

    void addHost(const HostInfo& host);
    bool setOnline(const std::string& hostId, bool online);

private:
    std::vector<HostInfo> hosts_;
    mutable std::mutex mutex_;
};
