#pragma once

#include <chrono>
#include <cstdint>
#include <string>

// Smoothed throughput and ETA from bursty byte counters.
//
// A sample is taken only when more than kMinSampleInterval elapsed since the
// last accepted observation and the counter moved forward. The smoothed speed
// is an exponential moving average with weight kSampleWeight on the new sample.
// The estimate is for display only and can be rebuilt from raw counters.
class TransferMeter {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    static constexpr double kMinSampleInterval = 0.5;   // Seconds
    static constexpr double kSampleWeight = 0.4;

    TransferMeter();
    TransferMeter(uint64_t bytes, TimePoint now);

    // Restart from a known counter value, keeping no speed history
    void reset(uint64_t bytes, TimePoint now);

    // Feed a new counter value; returns the (possibly unchanged) smoothed speed
    double observe(uint64_t newBytes, TimePoint now);

    // Stateless form of one observation. Returns true and writes newSpeed when
    // the sample passes the gate; otherwise newSpeed equals prevSpeed.
    static bool observe(uint64_t prevBytes, TimePoint prevTime,
                        uint64_t newBytes, TimePoint now,
                        double prevSpeed, double& newSpeed);

    double getSpeed() const { return smoothedSpeed_; }
    uint64_t getLastBytes() const { return lastBytes_; }

    // Seconds left at the current speed, rounded up. False if unknown.
    bool getEtaSeconds(uint64_t remainingBytes, uint64_t& etaSeconds) const;

private:
    uint64_t lastBytes_;
    TimePoint lastTime_;
    double smoothedSpeed_;
};

// "512 B", "1.5 KB", "12.3 MB", ...
std::string formatBytes(double bytes);

// "45s", "2m5s", "3m"; empty for zero
std::string formatEta(uint64_t seconds);
