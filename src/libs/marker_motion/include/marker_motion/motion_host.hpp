#pragma once

#include <marker_motion/motion_config.hpp>
#include <cstdint>
#include <functional>

namespace marker_motion {

// What the embedding application provides: time, a per-frame callback and
// periodic timers. All callbacks run on the host's single thread.
class MotionHost {
public:
    using FrameCallback = std::function<void(Timestamp)>;
    using TimerCallback = std::function<void(Timestamp)>;
    using CallbackId = std::uint64_t;

    virtual ~MotionHost() = default;

    virtual Timestamp now() const = 0;

    virtual CallbackId add_frame_callback(FrameCallback callback) = 0;
    virtual void remove_frame_callback(CallbackId id) = 0;

    virtual CallbackId start_periodic_timer(std::chrono::milliseconds interval, TimerCallback callback) = 0;
    virtual void cancel_timer(CallbackId id) = 0;
};

} // namespace marker_motion
