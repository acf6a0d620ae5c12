#pragma once

#include <marker_motion/curves.hpp>
#include <chrono>
#include <stdexcept>
#include <string>

namespace marker_motion {

using Duration = std::chrono::microseconds;
// Host time, measured from an arbitrary host epoch.
using Timestamp = std::chrono::microseconds;

enum class MotionImplementation { FrameDriven, TimerDriven };

const char* to_string(MotionImplementation implementation);

class MotionConfigError : public std::invalid_argument {
public:
    explicit MotionConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Immutable once constructed. The constructor throws MotionConfigError on an
// invalid combination, so an engine never sees a bad config.
class MotionConfig {
public:
    static constexpr int kDefaultFrameRate = 60;
    static constexpr int kMinFrameRate = 1;
    static constexpr int kMaxFrameRate = 120;
    static constexpr Duration kDefaultDuration = std::chrono::milliseconds(1000);

    MotionConfig();
    explicit MotionConfig(MotionImplementation implementation,
        Duration duration = kDefaultDuration,
        Curve curve = Curve::linear(),
        int frame_rate = kDefaultFrameRate);

    MotionImplementation implementation() const { return implementation_; }
    Duration duration() const { return duration_; }
    const Curve& curve() const { return curve_; }
    int frame_rate() const { return frame_rate_; }

    // Timer period, round(1000 / frame_rate) milliseconds.
    std::chrono::milliseconds frame_interval() const;

private:
    void validate() const;

    MotionImplementation implementation_ = MotionImplementation::FrameDriven;
    Duration duration_ = kDefaultDuration;
    Curve curve_;
    int frame_rate_ = kDefaultFrameRate;
};

} // namespace marker_motion
