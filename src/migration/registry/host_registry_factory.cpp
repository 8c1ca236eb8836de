#include "migration/registry/host_registry_factory.hpp"
#include "migration/registry/http_host_registry.hpp"
#include "migration/registry/static_host_registry.hpp"
#include "common/logger.hpp"
#include <stdexcept>

std::shared_ptr<HostRegistry> createHostRegistry(const MigrationConfig& config) {
    Logger::info("Creating host registry of type: " + config.registry.type);

    if (config.registry.type == "static") {
        return std::make_shared<StaticHostRegistry>(config.localHostId, config.hosts);
    } else if (config.registry.type == "http") {
        if (config.registry.url.empty()) {
            throw std::runtime_error("registry.url is required for the http registry");
        }
        Logger::debug("Host registry URL: " + config.registry.url);
        return std::make_shared<HttpHostRegistry>(config.localHostId, config.registry);
    }

    Logger::error("Unsupported host registry type: " + config.registry.type);
    throw std::runtime_error("Unsupported host registry type: " + config.registry.type);
}
