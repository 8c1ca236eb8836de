#include <gtest/gtest.h>
#include "migration/transfer_meter.hpp"
#include <cmath>

using Clock = TransferMeter::Clock;

namespace {

Clock::time_point at(double seconds) {
    return Clock::time_point() + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

} // namespace

TEST(TransferMeterTest, ConstantRateConverges) {
    TransferMeter meter(0, at(0));
    const double rate = 10.0 * 1024 * 1024;
    for (int i = 1; i <= 20; i++) {
        meter.observe(static_cast<uint64_t>(rate * i), at(i));
    }
    EXPECT_NEAR(rate, meter.getSpeed(), rate * 0.001);
}

TEST(TransferMeterTest, FirstSampleIsInstantSpeed) {
    TransferMeter meter(0, at(0));
    EXPECT_DOUBLE_EQ(1000.0, meter.observe(2000, at(2)));
}

TEST(TransferMeterTest, MovingAverageWeightsNewSample) {
    TransferMeter meter(0, at(0));
    meter.observe(1000, at(1));           // 1000 B/s
    double speed = meter.observe(4000, at(2));   // instant 3000 B/s
    EXPECT_DOUBLE_EQ(1000.0 * 0.6 + 3000.0 * 0.4, speed);
}

TEST(TransferMeterTest, BurstsBelowIntervalAreIgnored) {
    TransferMeter meter(0, at(0));
    EXPECT_DOUBLE_EQ(0.0, meter.observe(500, at(0.1)));
    EXPECT_DOUBLE_EQ(0.0, meter.observe(900, at(0.5)));
    EXPECT_EQ(0u, meter.getLastBytes());

    uint64_t eta = 0;
    EXPECT_FALSE(meter.getEtaSeconds(1000, eta));

    // The window keeps growing from the last accepted sample
    EXPECT_DOUBLE_EQ(1000.0, meter.observe(1000, at(1.0)));
    EXPECT_EQ(1000u, meter.getLastBytes());
}

TEST(TransferMeterTest, NonPositiveDeltaIsIgnored) {
    TransferMeter meter(1000, at(0));
    EXPECT_DOUBLE_EQ(0.0, meter.observe(1000, at(5)));
    EXPECT_DOUBLE_EQ(0.0, meter.observe(500, at(6)));

    double speed = -1.0;
    EXPECT_FALSE(TransferMeter::observe(1000, at(0), 900, at(10), 42.0, speed));
    EXPECT_DOUBLE_EQ(42.0, speed);
}

TEST(TransferMeterTest, EtaRoundsUp) {
    TransferMeter meter(0, at(0));
    meter.observe(3000, at(1));
    uint64_t eta = 0;
    ASSERT_TRUE(meter.getEtaSeconds(10000, eta));
    EXPECT_EQ(4u, eta);
    EXPECT_FALSE(meter.getEtaSeconds(0, eta));
}

TEST(TransferMeterTest, ResetDropsHistory) {
    TransferMeter meter(0, at(0));
    meter.observe(5000, at(1));
    meter.reset(5000, at(10));
    EXPECT_DOUBLE_EQ(0.0, meter.getSpeed());
    EXPECT_DOUBLE_EQ(100.0, meter.observe(5100, at(11)));
}

TEST(TransferMeterTest, FormatBytes) {
    EXPECT_EQ("0 B", formatBytes(0));
    EXPECT_EQ("512 B", formatBytes(512));
    EXPECT_EQ("1.5 KB", formatBytes(1536));
    EXPECT_EQ("10.0 MB", formatBytes(10.0 * 1024 * 1024));
    EXPECT_EQ("2.0 GB", formatBytes(2.0 * 1024 * 1024 * 1024));
}

TEST(TransferMeterTest, FormatEta) {
    EXPECT_EQ("", formatEta(0));
    EXPECT_EQ("45s", formatEta(45));
    EXPECT_EQ("2m5s", formatEta(125));
    EXPECT_EQ("3m", formatEta(180));
}
