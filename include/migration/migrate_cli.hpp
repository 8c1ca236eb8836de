#pragma once

#include "migration/container_inventory.hpp"
#include "migration/host_registry.hpp"
#include "migration/migration_orchestrator.hpp"
#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

// Operator commands against one orchestrator. Every command writes its
// result to out and returns a process exit code.
class MigrateCLI {
public:
    MigrateCLI(std::shared_ptr<MigrationOrchestrator> orchestrator,
               std::shared_ptr<HostRegistry> registry,
               std::shared_ptr<ContainerInventory> inventory);

    // args[0] is the command name
    int execute(const std::vector<std::string>& args, std::ostream& out);

    // Reads commands line by line until "quit" or end of input
    int runConsole(std::istream& in, std::ostream& out);

    // Set from a signal handler; a watched migration is cancelled once
    static std::atomic<bool> interruptRequested;

    void printUsage(std::ostream& out) const;

private:
    int handleMigrate(const std::vector<std::string>& args, std::ostream& out);
    int handleCancel(const std::vector<std::string>& args, std::ostream& out);
    int handleStatus(const std::vector<std::string>& args, std::ostream& out);
    int handleList(std::ostream& out);
    int handleDismiss(const std::vector<std::string>& args, std::ostream& out);
    int handleHosts(std::ostream& out);
    int handleContainers(std::ostream& out);

    // Prints each event as a JSON line until the job reaches a terminal phase
    int watch(const std::shared_ptr<Subscription>& subscription, const std::shared_ptr<MigrationJob>& job,
              std::ostream& out);
    int finishWatch(const std::shared_ptr<Subscription>& subscription, const JobEvent& event,
                    std::ostream& out);

    void printSnapshot(const MigrationSnapshot& snapshot, std::ostream& out) const;

    std::shared_ptr<MigrationOrchestrator> orchestrator_;
    std::shared_ptr<HostRegistry> registry_;
    std::shared_ptr<ContainerInventory> inventory_;
    bool interactive_{false};
};
