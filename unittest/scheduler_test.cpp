#include <gtest/gtest.h>
#include "common/scheduler.hpp"
#include <atomic>
#include <thread>

TEST(SchedulerTest, DelayedTaskRunsOnce) {
    Scheduler scheduler;
    std::atomic<int> runs{0};
    scheduler.start();
    ASSERT_TRUE(scheduler.scheduleTask("reap", std::chrono::milliseconds(50), [&runs]() { runs++; }));
    EXPECT_TRUE(scheduler.hasTask("reap"));

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    scheduler.stop();
    EXPECT_EQ(1, runs.load());
    EXPECT_FALSE(scheduler.hasTask("reap"));
}

TEST(SchedulerTest, CancelledTaskNeverRuns) {
    Scheduler scheduler;
    std::atomic<int> runs{0};
    scheduler.start();
    scheduler.scheduleTask("reap", std::chrono::milliseconds(200), [&runs]() { runs++; });
    EXPECT_TRUE(scheduler.cancelTask("reap"));
    EXPECT_FALSE(scheduler.cancelTask("reap"));

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    scheduler.stop();
    EXPECT_EQ(0, runs.load());
}

TEST(SchedulerTest, PeriodicTaskRepeats) {
    Scheduler scheduler;
    std::atomic<int> runs{0};
    scheduler.start();
    scheduler.schedulePeriodicTask("watch", std::chrono::milliseconds(20), [&runs]() { runs++; });

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    scheduler.stop();
    EXPECT_GE(runs.load(), 3);
    EXPECT_TRUE(scheduler.hasTask("watch"));
}

TEST(SchedulerTest, ProcessTasksRunsDueTasksInline) {
    Scheduler scheduler;
    int runs = 0;
    scheduler.scheduleTask("now", std::chrono::milliseconds(0), [&runs]() { runs++; });
    scheduler.scheduleTask("later", std::chrono::hours(1), [&runs]() { runs++; });

    scheduler.processTasks();
    EXPECT_EQ(1, runs);
    EXPECT_EQ(1u, scheduler.pendingTaskCount());
}

TEST(SchedulerTest, ThrowingTaskDoesNotStopScheduler) {
    Scheduler scheduler;
    std::atomic<int> runs{0};
    scheduler.start();
    scheduler.scheduleTask("bad", std::chrono::milliseconds(10), []() { throw std::runtime_error("boom"); });
    scheduler.scheduleTask("good", std::chrono::milliseconds(50), [&runs]() { runs++; });

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    scheduler.stop();
    EXPECT_EQ(1, runs.load());
}
