#pragma once

#include "migration/host_registry.hpp"
#include "common/migration_config.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>

// Host list fetched from the host manager API (GET <url>/api/hosts).
//
// Accepts either a bare array or {"hosts": [...]}; each entry needs "id" and
// may carry "name", "host" or "address", and either "status" ("online" ...)
// or a boolean "online".
class HttpHostRegistry : public HostRegistry {
public:
    HttpHostRegistry(const std::string& localHostId, const RegistryConfig& config);

    bool listHosts(std::vector<HostInfo>& hosts) override;
    std::string getLastError() const override;

    static bool parseHosts(const nlohmann::json& response, std::vector<HostInfo>& hosts, std::string& error);

private:
    bool fetch(const std::string& url, std::string& body);
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);
    void setLastError(const std::string& error);

    RegistryConfig config_;
    std::string lastError_;
    mutable std::mutex mutex_;
};
