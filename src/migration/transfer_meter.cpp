#include "migration/transfer_meter.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

constexpr double TransferMeter::kMinSampleInterval;
constexpr double TransferMeter::kSampleWeight;

TransferMeter::TransferMeter()
    : lastBytes_(0)
    , lastTime_(Clock::now())
    , smoothedSpeed_(0.0) {
}

TransferMeter::TransferMeter(uint64_t bytes, TimePoint now)
    : lastBytes_(bytes)
    , lastTime_(now)
    , smoothedSpeed_(0.0) {
}

void TransferMeter::reset(uint64_t bytes, TimePoint now) {
    lastBytes_ = bytes;
    lastTime_ = now;
    smoothedSpeed_ = 0.0;
}

bool TransferMeter::observe(uint64_t prevBytes, TimePoint prevTime,
                            uint64_t newBytes, TimePoint now,
                            double prevSpeed, double& newSpeed) {
    newSpeed = prevSpeed;

    std::chrono::duration<double> elapsed = now - prevTime;
    if (elapsed.count() <= kMinSampleInterval || newBytes <= prevBytes) {
        return false;
    }

    double instant = static_cast<double>(newBytes - prevBytes) / elapsed.count();
    newSpeed = prevSpeed > 0.0
        ? prevSpeed * (1.0 - kSampleWeight) + instant * kSampleWeight
        : instant;
    return true;
}

double TransferMeter::observe(uint64_t newBytes, TimePoint now) {
    double speed = smoothedSpeed_;
    if (observe(lastBytes_, lastTime_, newBytes, now, smoothedSpeed_, speed)) {
        smoothedSpeed_ = speed;
        lastBytes_ = newBytes;
        lastTime_ = now;
    }
    return smoothedSpeed_;
}

bool TransferMeter::getEtaSeconds(uint64_t remainingBytes, uint64_t& etaSeconds) const {
    if (smoothedSpeed_ <= 0.0 || remainingBytes == 0) {
        return false;
    }
    etaSeconds = static_cast<uint64_t>(std::ceil(static_cast<double>(remainingBytes) / smoothedSpeed_));
    return true;
}

std::string formatBytes(double bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    while (bytes >= 1024.0 && unit < 4) {
        bytes /= 1024.0;
        ++unit;
    }

    std::stringstream ss;
    if (unit == 0) {
        ss << static_cast<uint64_t>(bytes) << " " << units[unit];
    } else {
        ss << std::fixed << std::setprecision(1) << bytes << " " << units[unit];
    }
    return ss.str();
}

std::string formatEta(uint64_t seconds) {
    if (seconds == 0) {
        return "";
    }
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    uint64_t minutes = seconds / 60;
    uint64_t rest = seconds % 60;
    if (rest > 0) {
        return std::to_string(minutes) + "m" + std::to_string(rest) + "s";
    }
    return std::to_string(minutes) + "m";
}
