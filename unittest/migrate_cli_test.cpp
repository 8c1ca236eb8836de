#include <gtest/gtest.h>
#include "fakes.hpp"
#include "migration/migrate_cli.hpp"
#include "migration/registry/static_host_registry.hpp"
#include <atomic>
#include <sstream>
#include <thread>

class MigrateCLITest : public ::testing::Test {
protected:
    void SetUp() override {
        MigrateCLI::interruptRequested.store(false);
        config_.localHostId = "h1";
        config_.stallThresholdSeconds = 0;
        config_.verifyTimeoutSeconds = 1;

        registry_ = std::make_shared<StaticHostRegistry>(
            "h1", std::vector<HostConfig>{{"h2", "two", "10.0.0.2", true}, {"h3", "three", "10.0.0.3", false}});
        lifecycle_ = std::make_shared<FakeContainerLifecycle>();
        transport_ = std::make_shared<FakeArtifactTransport>();
        inventory_ = std::make_shared<ContainerInventory>();
        inventory_->upsert({"c1", "h1", "running"});
        orchestrator_ = std::make_shared<MigrationOrchestrator>(
            config_, registry_, lifecycle_, transport_, inventory_,
            std::make_shared<MigrationJobStore>(), std::make_shared<ProgressPublisher>(64));
        cli_ = std::make_unique<MigrateCLI>(orchestrator_, registry_, inventory_);
    }

    void TearDown() override {
        MigrateCLI::interruptRequested.store(false);
        cli_.reset();
        orchestrator_.reset();
    }

    int run(const std::vector<std::string>& args) {
        out_.str("");
        return cli_->execute(args, out_);
    }

    MigrationConfig config_;
    std::shared_ptr<StaticHostRegistry> registry_;
    std::shared_ptr<FakeContainerLifecycle> lifecycle_;
    std::shared_ptr<FakeArtifactTransport> transport_;
    std::shared_ptr<ContainerInventory> inventory_;
    std::shared_ptr<MigrationOrchestrator> orchestrator_;
    std::unique_ptr<MigrateCLI> cli_;
    std::ostringstream out_;
};

TEST_F(MigrateCLITest, MigrateWatchesUntilComplete) {
    EXPECT_EQ(0, run({"migrate", "c1", "h2"}));

    std::string output = out_.str();
    EXPECT_NE(std::string::npos, output.find("\"event\":\"migration:progress\""));
    EXPECT_NE(std::string::npos, output.find("\"phase\":\"stopping\""));
    EXPECT_NE(std::string::npos, output.find("\"phase\":\"complete\""));
    EXPECT_EQ(std::string::npos, output.find("\"phase\":\"failed\""));
}

TEST_F(MigrateCLITest, FailedMigrationExitsNonZero) {
    lifecycle_->failStop = true;
    EXPECT_EQ(1, run({"migrate", "c1", "h2"}));
    EXPECT_NE(std::string::npos, out_.str().find("Lifecycle failure"));
}

TEST_F(MigrateCLITest, RejectedMigrationNamesTheError) {
    EXPECT_EQ(1, run({"migrate", "c1", "h3"}));
    EXPECT_NE(std::string::npos, out_.str().find("InvalidTarget"));

    EXPECT_EQ(1, run({"migrate", "c1"}));
    EXPECT_NE(std::string::npos, out_.str().find("Usage"));
}

TEST_F(MigrateCLITest, InterruptCancelsWatchedMigration) {
    // Keep the job in stopping long enough for the cancel to land
    lifecycle_->onCall = [](const std::string& call) {
        if (call == "stop:c1@h1") {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    };
    MigrateCLI::interruptRequested.store(true);
    EXPECT_EQ(1, run({"migrate", "c1", "h2"}));
    EXPECT_NE(std::string::npos, out_.str().find("Migration cancelled by operator"));
}

TEST_F(MigrateCLITest, WatchEndsWhenTerminalEventIsEvicted) {
    // A one-slot queue that other transfers' terminal events keep overwriting
    auto publisher = std::make_shared<ProgressPublisher>(1);
    auto orchestrator = std::make_shared<MigrationOrchestrator>(
        config_, registry_, lifecycle_, transport_, inventory_,
        std::make_shared<MigrationJobStore>(), publisher);
    MigrateCLI cli(orchestrator, registry_, inventory_);

    std::atomic<bool> done{false};
    std::thread flooder([&]() {
        MigrationSnapshot snapshot;
        while (!done.load()) {
            if (orchestrator->status("c1", snapshot) && isTerminalPhase(snapshot.phase)) {
                for (int i = 0; i < 8; i++) {
                    JobEvent other;
                    other.containerId = "c9";
                    other.transferId = "other-" + std::to_string(i);
                    other.phase = MigrationPhase::Failed;
                    publisher->publish(other);
                }
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    std::ostringstream out;
    int rc = cli.execute({"migrate", "c1", "h2"}, out);
    done.store(true);
    flooder.join();

    EXPECT_EQ(0, rc);
    EXPECT_NE(std::string::npos, out.str().find("\"phase\":\"complete\""));
    orchestrator->waitForAll();
}

TEST_F(MigrateCLITest, StatusListAndDismiss) {
    EXPECT_EQ(1, run({"status", "c1"}));
    EXPECT_EQ(0, run({"list"}));
    EXPECT_NE(std::string::npos, out_.str().find("No migrations"));

    lifecycle_->failStop = true;
    run({"migrate", "c1", "h2", "--no-watch"});
    orchestrator_->waitForAll();

    EXPECT_EQ(0, run({"status", "c1"}));
    EXPECT_NE(std::string::npos, out_.str().find("failed"));
    EXPECT_EQ(1, run({"cancel", "c1"}));
    EXPECT_EQ(0, run({"dismiss", "c1"}));
    EXPECT_EQ(1, run({"dismiss", "c1"}));
}

TEST_F(MigrateCLITest, HostsAndContainers) {
    EXPECT_EQ(0, run({"hosts"}));
    std::string hosts = out_.str();
    EXPECT_NE(std::string::npos, hosts.find("h2"));
    EXPECT_NE(std::string::npos, hosts.find("offline"));

    EXPECT_EQ(0, run({"containers"}));
    EXPECT_NE(std::string::npos, out_.str().find("c1"));
}

TEST_F(MigrateCLITest, ConsoleRunsCommandsUntilQuit) {
    std::istringstream in("migrate c1 h2\nlist\nquit\nhosts\n");
    std::ostringstream out;
    EXPECT_EQ(0, cli_->runConsole(in, out));
    orchestrator_->waitForAll();

    std::string output = out.str();
    EXPECT_NE(std::string::npos, output.find("started"));
    EXPECT_EQ(std::string::npos, output.find("ADDRESS"));
}

TEST_F(MigrateCLITest, UnknownCommand) {
    EXPECT_EQ(1, run({"teleport"}));
    EXPECT_NE(std::string::npos, out_.str().find("Unknown command"));
}
