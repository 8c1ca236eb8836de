#include <gtest/gtest.h>
#include "migration/migration_status.hpp"

TEST(MigrationStatusTest, WireNames) {
    EXPECT_EQ("stopping", phaseToString(MigrationPhase::Stopping));
    EXPECT_EQ("transferring_workspace", phaseToString(MigrationPhase::TransferringWorkspace));
    EXPECT_EQ("importing_workspace", phaseToString(MigrationPhase::ImportingWorkspace));
    EXPECT_EQ("complete", phaseToString(MigrationPhase::Complete));

    MigrationPhase phase = MigrationPhase::Stopping;
    EXPECT_TRUE(phaseFromString("verifying", phase));
    EXPECT_EQ(MigrationPhase::Verifying, phase);
    EXPECT_FALSE(phaseFromString("rolling_back", phase));
    EXPECT_EQ(MigrationPhase::Verifying, phase);
}

TEST(MigrationStatusTest, HappyPathIsLinear) {
    MigrationPhase phase = MigrationPhase::Stopping;
    int steps = 0;
    while (!isTerminalPhase(phase)) {
        MigrationPhase next = nextPhase(phase);
        EXPECT_TRUE(isValidTransition(phase, next));
        phase = next;
        steps++;
    }
    EXPECT_EQ(MigrationPhase::Complete, phase);
    EXPECT_EQ(8, steps);
}

TEST(MigrationStatusTest, SkippingOrGoingBackIsInvalid) {
    EXPECT_FALSE(isValidTransition(MigrationPhase::Transferring, MigrationPhase::Importing));
    EXPECT_FALSE(isValidTransition(MigrationPhase::Importing, MigrationPhase::Transferring));
    EXPECT_FALSE(isValidTransition(MigrationPhase::Stopping, MigrationPhase::Complete));
}

TEST(MigrationStatusTest, FailedReachableFromActivePhasesOnly) {
    EXPECT_TRUE(isValidTransition(MigrationPhase::Stopping, MigrationPhase::Failed));
    EXPECT_TRUE(isValidTransition(MigrationPhase::Verifying, MigrationPhase::Failed));
    EXPECT_FALSE(isValidTransition(MigrationPhase::Complete, MigrationPhase::Failed));
    EXPECT_FALSE(isValidTransition(MigrationPhase::Failed, MigrationPhase::Stopping));
}
