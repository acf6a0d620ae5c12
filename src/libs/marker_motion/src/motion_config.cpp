#include <marker_motion/motion_config.hpp>
#include <marker_motion/motion_log.hpp>
#include <cmath>
#include <utility>

namespace marker_motion {

namespace {

[[noreturn]] void reject(const std::string& message) {
    motion_logger()->error("invalid motion config: {}", message);
    throw MotionConfigError(message);
}

} // namespace

const char* to_string(MotionImplementation implementation) {
    switch (implementation) {
    case MotionImplementation::FrameDriven: return "frame";
    case MotionImplementation::TimerDriven: return "timer";
    }
    return "unknown";
}

MotionConfig::MotionConfig() = default;

MotionConfig::MotionConfig(MotionImplementation implementation, Duration duration, Curve curve,
    int frame_rate)
    : implementation_(implementation)
    , duration_(duration)
    , curve_(std::move(curve))
    , frame_rate_(frame_rate)
{
    validate();
}

std::chrono::milliseconds MotionConfig::frame_interval() const {
    return std::chrono::milliseconds(std::lround(1000.0 / static_cast<double>(frame_rate_)));
}

void MotionConfig::validate() const {
    if (duration_.count() < 0)
        reject("duration must not be negative");

    if (implementation_ == MotionImplementation::FrameDriven) {
        // Frame-driven motion follows the host's display cadence.
        if (frame_rate_ != kDefaultFrameRate)
            reject("frame_rate can only be customized for the timer implementation");
        return;
    }

    if (frame_rate_ < kMinFrameRate || frame_rate_ > kMaxFrameRate)
        reject("frame_rate must be within [1, 120] for the timer implementation, got "
            + std::to_string(frame_rate_));
    if (!curve_.is_linear())
        reject("the timer implementation only supports the linear curve, got " + curve_.name());
}

} // namespace marker_motion
