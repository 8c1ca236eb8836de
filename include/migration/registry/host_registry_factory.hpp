#pragma once

#include "common/migration_config.hpp"
#include "migration/host_registry.hpp"
#include <memory>

// Builds the registry named by config.registry.type ("static" or "http").
// Throws std::runtime_error for an unknown type.
std::shared_ptr<HostRegistry> createHostRegistry(const MigrationConfig& config);
