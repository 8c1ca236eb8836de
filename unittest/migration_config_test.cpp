#include <gtest/gtest.h>
#include "common/migration_config.hpp"
#include "test_utils.hpp"
#include <stdexcept>

TEST(MigrationConfigTest, DefaultsWhenEmpty) {
    MigrationConfig config = parseMigrationConfig("{}");
    EXPECT_EQ("local", config.localHostId);
    EXPECT_EQ(4, config.maxConcurrentMigrations);
    EXPECT_EQ(5, config.completedJobGraceSeconds);
    EXPECT_EQ("static", config.registry.type);
    EXPECT_TRUE(config.restartSourceOnAbort);

    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;
}

TEST(MigrationConfigTest, ParsesFields) {
    MigrationConfig config = parseMigrationConfig(R"({
        "localHostId": "node-a",
        "logLevel": "debug",
        "verifyTimeoutSeconds": 30,
        "chunkSizeBytes": 1048576,
        "stagingRoot": "/srv/staging",
        "hostStagingDir": "/srv/outbox",
        "restartSourceOnAbort": false,
        "registry": {"type": "http", "url": "http://manager:3000", "apiToken": "secret"},
        "hosts": [{"id": "node-b", "address": "10.0.0.2"},
                  {"id": "node-c", "name": "spare", "address": "10.0.0.3", "online": false}]
    })");

    EXPECT_EQ("node-a", config.localHostId);
    EXPECT_EQ(30, config.verifyTimeoutSeconds);
    EXPECT_EQ(1048576u, config.chunkSizeBytes);
    EXPECT_EQ("/srv/outbox", config.hostStagingDir);
    EXPECT_FALSE(config.restartSourceOnAbort);
    EXPECT_EQ("http", config.registry.type);
    EXPECT_EQ("secret", config.registry.apiToken);
    ASSERT_EQ(2u, config.hosts.size());
    EXPECT_EQ("node-b", config.hosts[0].name);
    EXPECT_TRUE(config.hosts[0].online);
    EXPECT_FALSE(config.hosts[1].online);
}

TEST(MigrationConfigTest, RejectsBadJson) {
    EXPECT_THROW(parseMigrationConfig("{not json"), std::runtime_error);
    EXPECT_THROW(parseMigrationConfig(R"({"maxConcurrentMigrations": "many"})"), std::runtime_error);
}

TEST(MigrationConfigTest, ValidateCatchesBadValues) {
    std::string error;

    MigrationConfig config = parseMigrationConfig(R"({"hosts": [{"id": "local"}]})");
    EXPECT_FALSE(config.validate(error));

    config = parseMigrationConfig(R"({"localHostId": "h1", "hosts": [{"id": "local"}]})");
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(std::string::npos, error.find("reserved"));

    config = parseMigrationConfig(R"({"hosts": [{"id": "h2"}, {"id": "h2"}]})");
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(std::string::npos, error.find("Duplicate"));

    config = parseMigrationConfig(R"({"registry": {"type": "http"}})");
    EXPECT_FALSE(config.validate(error));

    config = parseMigrationConfig(R"({"maxConcurrentMigrations": 0})");
    EXPECT_FALSE(config.validate(error));
}

TEST(MigrationConfigTest, LoadFromFile) {
    TempDir dir;
    writeFile(dir.file("liveshift.json"), R"({"localHostId": "node-a"})");
    EXPECT_EQ("node-a", loadMigrationConfig(dir.file("liveshift.json")).localHostId);

    EXPECT_THROW(loadMigrationConfig(dir.file("missing.json")), std::runtime_error);

    writeFile(dir.file("invalid.json"), R"({"verifyTimeoutSeconds": -1})");
    EXPECT_THROW(loadMigrationConfig(dir.file("invalid.json")), std::runtime_error);
}
