#pragma once

#include <marker_motion/motion_host.hpp>
#include <map>

// Motion host on top of the SDL main loop. The loop calls run_frame() once per
// rendered frame: due timers fire first, then the frame callbacks.
class SdlMotionHost : public marker_motion::MotionHost {
public:
    marker_motion::Timestamp now() const override;

    CallbackId add_frame_callback(FrameCallback callback) override;
    void remove_frame_callback(CallbackId id) override;

    CallbackId start_periodic_timer(std::chrono::milliseconds interval, TimerCallback callback) override;
    void cancel_timer(CallbackId id) override;

    void run_frame();

private:
    struct Timer {
        marker_motion::Duration interval{0};
        marker_motion::Timestamp next_due{0};
        TimerCallback callback;
    };

    CallbackId next_id_ = 1;
    std::map<CallbackId, FrameCallback> frame_callbacks_;
    std::map<CallbackId, Timer> timers_;
};
