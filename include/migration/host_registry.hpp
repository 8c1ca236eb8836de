#pragma once

#include <string>
#include <vector>

struct HostInfo {
    std::string id;
    std::string name;
    std::string address;
    bool online{false};
};

// Read-only facts about the hosts containers can live on.
class HostRegistry {
public:
    explicit HostRegistry(const std::string& localHostId) : localHostId_(localHostId) {}
    virtual ~HostRegistry() = default;

    virtual bool listHosts(std::vector<HostInfo>& hosts) = 0;
    virtual std::string getLastError() const = 0;

    bool findHost(const std::string& hostId, HostInfo& host);

    // True for the local host or a known host that is online. reason explains
    // a refusal.
    bool isValidTarget(const std::string& hostId, std::string& reason);

    bool isLocal(const std::string& hostId) const {
        return hostId == localHostId_ || hostId == kLocalAlias;
    }
    const std::string& getLocalHostId() const { return localHostId_; }

    // Maps the reserved "local" id to the configured local host id
    std::string resolve(const std::string& hostId) const {
        return hostId == kLocalAlias ? localHostId_ : hostId;
    }

    static constexpr const char* kLocalAlias = "local";

private:
    std::string localHostId_;
};
