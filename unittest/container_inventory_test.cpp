#include <gtest/gtest.h>
#include "migration/container_inventory.hpp"
#include "test_utils.hpp"

TEST(ContainerInventoryTest, LoadsRecords) {
    TempDir dir;
    writeFile(dir.file("containers.json"),
              R"({"containers": [{"id": "web", "hostId": "local", "status": "running"},
                                  {"id": "db", "hostId": "h2"}]})");

    ContainerInventory inventory(dir.file("containers.json"));
    ASSERT_TRUE(inventory.load());

    ContainerRecord record;
    ASSERT_TRUE(inventory.getContainer("db", record));
    EXPECT_EQ("h2", record.hostId);
    EXPECT_EQ("unknown", record.status);
    EXPECT_EQ(2u, inventory.listContainers().size());
}

TEST(ContainerInventoryTest, RelocateIsPersisted) {
    TempDir dir;
    std::string path = dir.file("state/containers.json");
    {
        ContainerInventory inventory(path);
        inventory.upsert({"web", "local", "migrating"});
        ASSERT_TRUE(inventory.relocate("web", "h2"));
        EXPECT_FALSE(inventory.relocate("missing", "h2"));
    }

    ContainerInventory reloaded(path);
    ASSERT_TRUE(reloaded.load());
    ContainerRecord record;
    ASSERT_TRUE(reloaded.getContainer("web", record));
    EXPECT_EQ("h2", record.hostId);
    EXPECT_EQ("running", record.status);
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST(ContainerInventoryTest, MissingOrBrokenFileFailsToLoad) {
    TempDir dir;
    ContainerInventory missing(dir.file("nope.json"));
    EXPECT_FALSE(missing.load());
    EXPECT_FALSE(missing.getLastError().empty());

    writeFile(dir.file("broken.json"), R"({"containers": [{"hostId": "h2"}]})");
    ContainerInventory broken(dir.file("broken.json"));
    EXPECT_FALSE(broken.load());
}

TEST(ContainerInventoryTest, InMemoryWithoutPath) {
    ContainerInventory inventory;
    EXPECT_TRUE(inventory.load());
    inventory.upsert({"web", "local", "running"});
    EXPECT_TRUE(inventory.setStatus("web", "stopped"));
    EXPECT_FALSE(inventory.setStatus("db", "stopped"));

    ContainerRecord record;
    ASSERT_TRUE(inventory.getContainer("web", record));
    EXPECT_EQ("stopped", record.status);
}
