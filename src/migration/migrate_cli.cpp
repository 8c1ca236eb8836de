#include "migration/migrate_cli.hpp"
#include "migration/transfer_meter.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

std::atomic<bool> MigrateCLI::interruptRequested{false};

namespace {

std::vector<std::string> splitWords(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream stream(line);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

MigrateCLI::MigrateCLI(std::shared_ptr<MigrationOrchestrator> orchestrator,
                       std::shared_ptr<HostRegistry> registry,
                       std::shared_ptr<ContainerInventory> inventory)
    : orchestrator_(std::move(orchestrator))
    , registry_(std::move(registry))
    , inventory_(std::move(inventory)) {
}

void MigrateCLI::printUsage(std::ostream& out) const {
    out << "Commands:\n"
        << "  migrate <container> <host> [--watch|--no-watch]  Move a container to another host\n"
        << "  cancel <container>      Cancel a running migration\n"
        << "  status <container>      Show the latest migration of a container\n"
        << "  list                    Show all tracked migrations\n"
        << "  dismiss <container>     Forget a finished migration\n"
        << "  hosts                   List migration targets\n"
        << "  containers              List known containers\n";
}

int MigrateCLI::execute(const std::vector<std::string>& args, std::ostream& out) {
    if (args.empty()) {
        printUsage(out);
        return 1;
    }

    const std::string& command = args[0];
    try {
        if (command == "migrate") {
            return handleMigrate(args, out);
        } else if (command == "cancel") {
            return handleCancel(args, out);
        } else if (command == "status") {
            return handleStatus(args, out);
        } else if (command == "list") {
            return handleList(out);
        } else if (command == "dismiss") {
            return handleDismiss(args, out);
        } else if (command == "hosts") {
            return handleHosts(out);
        } else if (command == "containers") {
            return handleContainers(out);
        } else if (command == "help" || command == "-h" || command == "--help") {
            printUsage(out);
            return 0;
        }
    } catch (const std::exception& e) {
        Logger::error("Command " + command + " failed: " + e.what());
        out << "Error: " << e.what() << "\n";
        return 1;
    }

    out << "Unknown command: " << command << "\n";
    printUsage(out);
    return 1;
}

int MigrateCLI::runConsole(std::istream& in, std::ostream& out) {
    interactive_ = true;
    std::string line;
    out << "> " << std::flush;
    while (std::getline(in, line)) {
        std::vector<std::string> args = splitWords(line);
        if (!args.empty()) {
            if (args[0] == "quit" || args[0] == "exit") {
                break;
            }
            execute(args, out);
        }
        out << "> " << std::flush;
    }
    interactive_ = false;
    return 0;
}

int MigrateCLI::handleMigrate(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 3) {
        out << "Usage: migrate <container> <host> [--watch|--no-watch]\n";
        return 1;
    }
    const std::string& containerId = args[1];
    const std::string& targetHostId = args[2];

    bool watchEvents = !interactive_;
    for (size_t i = 3; i < args.size(); i++) {
        if (args[i] == "--watch") {
            watchEvents = true;
        } else if (args[i] == "--no-watch") {
            watchEvents = false;
        }
    }

    // Subscribe first so the initial stopping event is not missed
    std::shared_ptr<Subscription> subscription;
    if (watchEvents) {
        subscription = orchestrator_->getPublisher()->subscribe();
    }

    StartResult result = orchestrator_->startMigration(containerId, targetHostId);
    if (!result.ok()) {
        if (subscription) {
            orchestrator_->getPublisher()->unsubscribe(subscription);
        }
        out << "Migration rejected (" << errorToString(result.error) << "): " << result.message << "\n";
        return 1;
    }

    out << "Migration " << result.job->getTransferId() << " started: " << containerId << " "
        << result.job->getSourceHostId() << " -> " << targetHostId << "\n";
    if (!subscription) {
        return 0;
    }

    int rc = watch(subscription, result.job, out);
    orchestrator_->getPublisher()->unsubscribe(subscription);
    return rc;
}

int MigrateCLI::watch(const std::shared_ptr<Subscription>& subscription, const std::shared_ptr<MigrationJob>& job,
                      std::ostream& out) {
    const std::string& containerId = job->getContainerId();
    const std::string& transferId = job->getTransferId();
    bool cancelSent = false;
    while (true) {
        if (interruptRequested.load() && !cancelSent) {
            cancelSent = true;
            MigrationError rc = orchestrator_->cancel(containerId);
            out << "Cancelling migration of " << containerId << " (" << errorToString(rc) << ")\n";
        }

        JobEvent event;
        if (!subscription->waitNext(event, std::chrono::milliseconds(200))) {
            if (!job->isTerminal()) {
                continue;
            }
            // The terminal event was lost or is still in flight; take it from the job
            while (subscription->poll(event)) {
                if (event.transferId == transferId && isTerminalPhase(event.phase)) {
                    return finishWatch(subscription, event, out);
                }
            }
            Logger::warning("Terminal event for " + transferId + " not received; reporting job state");
            return finishWatch(subscription, job->toEvent(), out);
        }
        if (event.transferId != transferId) {
            continue;
        }

        if (isTerminalPhase(event.phase)) {
            return finishWatch(subscription, event, out);
        }
        out << toEnvelope(event).dump() << std::endl;
    }
}

int MigrateCLI::finishWatch(const std::shared_ptr<Subscription>& subscription, const JobEvent& event,
                            std::ostream& out) {
    out << toEnvelope(event).dump() << std::endl;
    if (subscription->droppedCount() > 0) {
        Logger::warning("Watcher dropped " + std::to_string(subscription->droppedCount()) + " events");
    }
    return event.phase == MigrationPhase::Complete ? 0 : 1;
}

int MigrateCLI::handleCancel(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 2) {
        out << "Usage: cancel <container>\n";
        return 1;
    }
    MigrationError rc = orchestrator_->cancel(args[1]);
    switch (rc) {
        case MigrationError::None:
            out << "Cancel requested for " << args[1] << "\n";
            return 0;
        case MigrationError::NotFound:
            out << "No migration found for " << args[1] << "\n";
            return 1;
        case MigrationError::NotCancellable:
            out << "Migration of " << args[1] << " already finished\n";
            return 1;
        default:
            out << "Cancel failed: " << errorToString(rc) << "\n";
            return 1;
    }
}

int MigrateCLI::handleStatus(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 2) {
        out << "Usage: status <container>\n";
        return 1;
    }
    MigrationSnapshot snapshot;
    if (!orchestrator_->status(args[1], snapshot)) {
        out << "No migration found for " << args[1] << "\n";
        return 1;
    }
    printSnapshot(snapshot, out);
    return 0;
}

int MigrateCLI::handleList(std::ostream& out) {
    auto snapshots = orchestrator_->listMigrations();
    if (snapshots.empty()) {
        out << "No migrations\n";
        return 0;
    }
    for (const auto& snapshot : snapshots) {
        printSnapshot(snapshot, out);
    }
    return 0;
}

int MigrateCLI::handleDismiss(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 2) {
        out << "Usage: dismiss <container>\n";
        return 1;
    }
    MigrationError rc = orchestrator_->dismiss(args[1]);
    if (rc == MigrationError::None) {
        out << "Dismissed " << args[1] << "\n";
        return 0;
    }
    if (rc == MigrationError::AlreadyInProgress) {
        out << "Migration of " << args[1] << " is still running\n";
    } else {
        out << "No migration found for " << args[1] << "\n";
    }
    return 1;
}

int MigrateCLI::handleHosts(std::ostream& out) {
    std::vector<HostInfo> hosts;
    if (!registry_->listHosts(hosts)) {
        out << "Failed to list hosts: " << registry_->getLastError() << "\n";
        return 1;
    }
    out << std::left << std::setw(16) << "ID" << std::setw(24) << "NAME" << std::setw(24) << "ADDRESS" << "STATUS\n";
    out << std::setw(16) << registry_->getLocalHostId() << std::setw(24) << "(this host)" << std::setw(24) << "-"
        << "online\n";
    for (const auto& host : hosts) {
        out << std::setw(16) << host.id << std::setw(24) << host.name << std::setw(24) << host.address
            << (host.online ? "online" : "offline") << "\n";
    }
    return 0;
}

int MigrateCLI::handleContainers(std::ostream& out) {
    auto containers = inventory_->listContainers();
    std::sort(containers.begin(), containers.end(),
              [](const ContainerRecord& a, const ContainerRecord& b) { return a.id < b.id; });
    out << std::left << std::setw(24) << "CONTAINER" << std::setw(16) << "HOST" << "STATUS\n";
    for (const auto& record : containers) {
        out << std::setw(24) << record.id << std::setw(16) << record.hostId << record.status << "\n";
    }
    return 0;
}

void MigrateCLI::printSnapshot(const MigrationSnapshot& snapshot, std::ostream& out) const {
    out << snapshot.containerId << " [" << snapshot.transferId << "] " << snapshot.sourceHostId << " -> "
        << snapshot.targetHostId << ": " << phaseToString(snapshot.phase) << " " << snapshot.progressPct << "%";
    if (snapshot.totalBytes > 0) {
        out << " (" << formatBytes(static_cast<double>(snapshot.bytesTransferred)) << " / "
            << formatBytes(static_cast<double>(snapshot.totalBytes)) << ")";
    }
    if (snapshot.speedBytesPerSec > 0.0 && !isTerminalPhase(snapshot.phase)) {
        out << " " << formatBytes(snapshot.speedBytesPerSec) << "/s";
        std::string eta = formatEta(snapshot.etaSeconds);
        if (!eta.empty()) {
            out << " eta " << eta;
        }
    }
    if (snapshot.cancelRequested && !isTerminalPhase(snapshot.phase)) {
        out << " cancelling";
    }
    if (snapshot.stalled) {
        out << " stalled";
    }
    if (!snapshot.error.empty()) {
        out << " error: " << snapshot.error;
    }
    out << "\n";
}
