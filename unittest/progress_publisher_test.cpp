#include <gtest/gtest.h>
#include "migration/progress_publisher.hpp"
#include <thread>

namespace {

JobEvent makeEvent(const std::string& transferId, MigrationPhase phase, uint64_t bytes = 0) {
    JobEvent event;
    event.containerId = "c1";
    event.transferId = transferId;
    event.phase = phase;
    event.bytesTransferred = bytes;
    event.totalBytes = 1000;
    return event;
}

} // namespace

TEST(ProgressPublisherTest, FansOutToEverySubscriber) {
    ProgressPublisher publisher(16);
    auto a = publisher.subscribe();
    auto b = publisher.subscribe();
    EXPECT_EQ(2u, publisher.subscriberCount());

    EXPECT_TRUE(publisher.publish(makeEvent("t1", MigrationPhase::Stopping)));
    EXPECT_EQ(1u, a->pending());
    EXPECT_EQ(1u, b->pending());
    EXPECT_EQ(1u, publisher.publishedCount());
}

TEST(ProgressPublisherTest, FullQueueDropsOldest) {
    ProgressPublisher publisher;
    auto slow = publisher.subscribe(3);
    for (uint64_t bytes = 100; bytes <= 500; bytes += 100) {
        publisher.publish(makeEvent("t1", MigrationPhase::Transferring, bytes));
    }

    EXPECT_EQ(2u, slow->droppedCount());
    auto events = slow->drain();
    ASSERT_EQ(3u, events.size());
    EXPECT_EQ(300u, events[0].bytesTransferred);
    EXPECT_EQ(500u, events[2].bytesTransferred);
}

TEST(ProgressPublisherTest, TerminalEventSurvivesOtherContainersTraffic) {
    ProgressPublisher publisher;
    auto slow = publisher.subscribe(2);

    JobEvent failed = makeEvent("t1", MigrationPhase::Failed);
    publisher.publish(failed);
    JobEvent other = makeEvent("t2", MigrationPhase::Stopping);
    other.containerId = "c2";
    publisher.publish(other);
    other.phase = MigrationPhase::Exporting;
    publisher.publish(other);

    EXPECT_EQ(1u, slow->droppedCount());
    auto events = slow->drain();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ("c1", events[0].containerId);
    EXPECT_EQ(MigrationPhase::Failed, events[0].phase);
    EXPECT_EQ(MigrationPhase::Exporting, events[1].phase);
}

TEST(ProgressPublisherTest, AllTerminalQueueDropsOldest) {
    ProgressPublisher publisher;
    auto slow = publisher.subscribe(2);
    publisher.publish(makeEvent("t1", MigrationPhase::Complete));
    publisher.publish(makeEvent("t2", MigrationPhase::Failed));
    publisher.publish(makeEvent("t3", MigrationPhase::Complete));

    auto events = slow->drain();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ("t2", events[0].transferId);
    EXPECT_EQ("t3", events[1].transferId);
}

TEST(ProgressPublisherTest, NothingAfterTerminalEvent) {
    ProgressPublisher publisher;
    auto subscription = publisher.subscribe();

    EXPECT_TRUE(publisher.publish(makeEvent("t1", MigrationPhase::Complete)));
    EXPECT_FALSE(publisher.publish(makeEvent("t1", MigrationPhase::Verifying)));
    EXPECT_FALSE(publisher.publish(makeEvent("t1", MigrationPhase::Failed)));

    // A new transfer of the same container is not affected
    EXPECT_TRUE(publisher.publish(makeEvent("t2", MigrationPhase::Stopping)));
    EXPECT_EQ(2u, subscription->pending());
}

TEST(ProgressPublisherTest, ReleasedSubscriberIsPruned) {
    ProgressPublisher publisher;
    auto kept = publisher.subscribe();
    {
        auto dropped = publisher.subscribe();
        EXPECT_EQ(2u, publisher.subscriberCount());
    }
    EXPECT_EQ(1u, publisher.subscriberCount());
    EXPECT_TRUE(publisher.publish(makeEvent("t1", MigrationPhase::Stopping)));
    EXPECT_EQ(1u, kept->pending());
}

TEST(ProgressPublisherTest, UnsubscribeClosesQueue) {
    ProgressPublisher publisher;
    auto subscription = publisher.subscribe();
    publisher.unsubscribe(subscription);

    EXPECT_TRUE(subscription->isClosed());
    EXPECT_EQ(0u, publisher.subscriberCount());
    publisher.publish(makeEvent("t1", MigrationPhase::Stopping));
    EXPECT_EQ(0u, subscription->pending());

    JobEvent event;
    EXPECT_FALSE(subscription->waitNext(event, std::chrono::milliseconds(10)));
}

TEST(ProgressPublisherTest, WaitNextWakesOnPublish) {
    ProgressPublisher publisher;
    auto subscription = publisher.subscribe();

    std::thread producer([&publisher]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        publisher.publish(makeEvent("t1", MigrationPhase::Exporting));
    });

    JobEvent event;
    EXPECT_TRUE(subscription->waitNext(event, std::chrono::seconds(5)));
    EXPECT_EQ(MigrationPhase::Exporting, event.phase);
    producer.join();

    EXPECT_FALSE(subscription->poll(event));
}
