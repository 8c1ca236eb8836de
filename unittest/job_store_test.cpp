#include <gtest/gtest.h>
#include "migration/job_store.hpp"
#include <atomic>
#include <thread>
#include <vector>

namespace {

void finish(const std::shared_ptr<MigrationJob>& job) {
    JobEvent event;
    MigrationPhase phase = job->getPhase();
    while (phase != MigrationPhase::Verifying) {
        phase = nextPhase(phase);
        job->advanceTo(phase, event);
    }
    job->complete(nullptr, event);
}

} // namespace

TEST(MigrationJobStoreTest, OneActiveJobPerContainer) {
    MigrationJobStore store;
    std::shared_ptr<MigrationJob> first;
    std::shared_ptr<MigrationJob> second;

    EXPECT_EQ(MigrationError::None, store.tryCreate("c1", "h1", "h2", first));
    EXPECT_EQ(MigrationError::AlreadyInProgress, store.tryCreate("c1", "h1", "h3", second));
    EXPECT_EQ(nullptr, second);
    EXPECT_EQ(first, store.getJob("c1"));
    EXPECT_TRUE(store.hasActiveJob("c1"));
    EXPECT_FALSE(store.hasActiveJob("c2"));
}

TEST(MigrationJobStoreTest, ConcurrentCreatesAdmitOne) {
    MigrationJobStore store;
    std::atomic<int> created{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&store, &created]() {
            std::shared_ptr<MigrationJob> job;
            if (store.tryCreate("c1", "h1", "h2", job) == MigrationError::None) {
                created++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(1, created.load());
    EXPECT_EQ(1u, store.size());
}

TEST(MigrationJobStoreTest, TerminalJobIsReplaced) {
    MigrationJobStore store;
    std::shared_ptr<MigrationJob> first;
    ASSERT_EQ(MigrationError::None, store.tryCreate("c1", "h1", "h2", first));
    finish(first);

    std::shared_ptr<MigrationJob> second;
    EXPECT_EQ(MigrationError::None, store.tryCreate("c1", "h2", "h1", second));
    EXPECT_NE(first->getTransferId(), second->getTransferId());
    EXPECT_EQ(second, store.getJob("c1"));
}

TEST(MigrationJobStoreTest, RemoveChecksTransferId) {
    MigrationJobStore store;
    std::shared_ptr<MigrationJob> job;
    ASSERT_EQ(MigrationError::None, store.tryCreate("c1", "h1", "h2", job));

    EXPECT_FALSE(store.removeJob("c1", "stale"));
    EXPECT_TRUE(store.removeJob("c1", job->getTransferId()));
    EXPECT_EQ(nullptr, store.getJob("c1"));
}

TEST(MigrationJobStoreTest, DismissOnlyTerminalJobs) {
    MigrationJobStore store;
    EXPECT_EQ(MigrationError::NotFound, store.dismissJob("c1"));

    std::shared_ptr<MigrationJob> job;
    ASSERT_EQ(MigrationError::None, store.tryCreate("c1", "h1", "h2", job));
    EXPECT_EQ(MigrationError::AlreadyInProgress, store.dismissJob("c1"));

    JobEvent event;
    job->fail(MigrationError::TransferFailure, "Transfer failure: reset", event);
    EXPECT_EQ(MigrationError::None, store.dismissJob("c1"));
    EXPECT_EQ(0u, store.size());
}

TEST(MigrationJobStoreTest, CleanupKeepsFailedJobs) {
    MigrationJobStore store;
    std::shared_ptr<MigrationJob> done;
    std::shared_ptr<MigrationJob> failed;
    std::shared_ptr<MigrationJob> running;
    store.tryCreate("c1", "h1", "h2", done);
    store.tryCreate("c2", "h1", "h2", failed);
    store.tryCreate("c3", "h1", "h2", running);
    finish(done);
    JobEvent event;
    failed->fail(MigrationError::LifecycleFailure, "Lifecycle failure: stop", event);

    auto later = MigrationJob::Clock::now() + std::chrono::seconds(10);
    EXPECT_EQ(0u, store.cleanupCompletedJobs(MigrationJob::Clock::now(), std::chrono::seconds(5)));
    EXPECT_EQ(1u, store.cleanupCompletedJobs(later, std::chrono::seconds(5)));
    EXPECT_EQ(nullptr, store.getJob("c1"));
    EXPECT_NE(nullptr, store.getJob("c2"));
    EXPECT_NE(nullptr, store.getJob("c3"));
}
