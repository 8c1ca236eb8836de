#include <gtest/gtest.h>
#include "migration/job_event.hpp"

TEST(JobEventTest, PayloadUsesWireNames) {
    JobEvent event;
    event.containerId = "c1";
    event.transferId = "t1";
    event.phase = MigrationPhase::TransferringWorkspace;
    event.progressPct = 42;
    event.bytesTransferred = 420;
    event.totalBytes = 1000;

    nlohmann::json payload = toJson(event);
    EXPECT_EQ("c1", payload["appId"]);
    EXPECT_EQ("transferring_workspace", payload["phase"]);
    EXPECT_EQ(42, payload["progressPct"]);
    EXPECT_EQ(420u, payload["bytesTransferred"]);
    EXPECT_EQ(1000u, payload["totalBytes"]);
    EXPECT_TRUE(payload["error"].is_null());
    EXPECT_FALSE(payload.contains("transferId"));
}

TEST(JobEventTest, EnvelopeNamesTheChannel) {
    JobEvent event;
    event.containerId = "c1";
    event.phase = MigrationPhase::Failed;
    event.error = "Transfer failure: connection reset";

    nlohmann::json envelope = toEnvelope(event);
    EXPECT_EQ("migration:progress", envelope["event"]);
    EXPECT_EQ("Transfer failure: connection reset", envelope["data"]["error"]);
}

TEST(JobEventTest, ParsesPayload) {
    nlohmann::json payload = {
        {"appId", "c7"}, {"phase", "failed"}, {"progressPct", 30},
        {"bytesTransferred", 300}, {"totalBytes", 1000}, {"error", "Migration cancelled by operator"}
    };
    JobEvent event;
    ASSERT_TRUE(fromJson(payload, event));
    EXPECT_EQ("c7", event.containerId);
    EXPECT_EQ(MigrationPhase::Failed, event.phase);
    EXPECT_EQ(300u, event.bytesTransferred);
    ASSERT_TRUE(event.error.has_value());
    EXPECT_EQ("Migration cancelled by operator", *event.error);
}

TEST(JobEventTest, RejectsMalformedPayload) {
    JobEvent event;
    EXPECT_FALSE(fromJson(nlohmann::json::array(), event));
    EXPECT_FALSE(fromJson({{"appId", "c1"}}, event));
    EXPECT_FALSE(fromJson({{"appId", "c1"}, {"phase", "paused"}, {"progressPct", 0},
                           {"bytesTransferred", 0}, {"totalBytes", 0}}, event));
}
