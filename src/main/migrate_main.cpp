#include "main/migrate_main.hpp"
#include "common/logger.hpp"
#include "common/migration_config.hpp"
#include "migration/migrate_cli.hpp"
#include "migration/lxc/libvirt_container_lifecycle.hpp"
#include "migration/registry/host_registry_factory.hpp"
#include "migration/transport/file_artifact_transport.hpp"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

const char* kDefaultConfigPath = "/etc/liveshift/liveshift.json";

void handleInterrupt(int) {
    MigrateCLI::interruptRequested.store(true);
}

} // namespace

void printMigrateUsage() {
    std::cout << "Usage: liveshift [options] <command> [args]\n"
              << "Commands:\n"
              << "  migrate <container> <host>  Move a container and watch its progress\n"
              << "  cancel <container>          Cancel a running migration\n"
              << "  status <container>          Show the latest migration of a container\n"
              << "  list                        Show all tracked migrations\n"
              << "  dismiss <container>         Forget a finished migration\n"
              << "  hosts                       List migration targets\n"
              << "  containers                  List known containers\n"
              << "  console                     Read commands from stdin\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <file>  Config file (default " << kDefaultConfigPath << ")\n"
              << "  -d, --debug          Log at debug level\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n";
}

int migrateMain(int argc, char* argv[]) {
    std::string configPath = kDefaultConfigPath;
    bool debug = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!args.empty()) {
            args.push_back(arg);
        } else if (arg == "-h" || arg == "--help") {
            printMigrateUsage();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "liveshift version 1.0.0\n";
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a file path" << std::endl;
                return 1;
            }
            configPath = argv[++i];
        } else if (arg == "-d" || arg == "--debug") {
            debug = true;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        printMigrateUsage();
        return 1;
    }

    MigrationConfig config = loadMigrationConfig(configPath);
    LogLevel level = debug ? LogLevel::DEBUG : parseLogLevel(config.logLevel);
    if (!Logger::initialize(config.logPath, level)) {
        std::cerr << "Failed to initialize logger at " << config.logPath << std::endl;
        return 1;
    }

    auto inventory = std::make_shared<ContainerInventory>(config.inventoryPath);
    if (std::filesystem::exists(config.inventoryPath)) {
        if (!inventory->load()) {
            Logger::error(inventory->getLastError());
            return 1;
        }
    } else {
        Logger::warning("Inventory " + config.inventoryPath + " not found, starting empty");
    }

    auto registry = createHostRegistry(config);
    auto lifecycle = std::make_shared<LibvirtContainerLifecycle>(config, registry);
    auto transport = std::make_shared<FileArtifactTransport>(config.stagingRoot, config.chunkSizeBytes,
                                                             config.verifyChecksums);
    auto store = std::make_shared<MigrationJobStore>();
    auto publisher = std::make_shared<ProgressPublisher>(static_cast<size_t>(config.subscriberQueueDepth));
    auto orchestrator = std::make_shared<MigrationOrchestrator>(config, registry, lifecycle, transport,
                                                                inventory, store, publisher);

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    MigrateCLI cli(orchestrator, registry, inventory);
    int rc = 0;
    if (args[0] == "console") {
        rc = cli.runConsole(std::cin, std::cout);
    } else {
        rc = cli.execute(args, std::cout);
    }

    orchestrator->waitForAll();
    Logger::shutdown();
    return rc;
}
