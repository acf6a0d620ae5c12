#pragma once

#include <marker_motion/motion_host.hpp>
#include <cstddef>
#include <map>

namespace marker_motion {

// Deterministic host driven by explicit pump calls. Time only moves when
// the owner pumps it, which makes motion reproducible in tests and in
// headless tools that replay marker updates.
class ManualMotionHost : public MotionHost {
public:
    explicit ManualMotionHost(Timestamp start = Timestamp{0});

    Timestamp now() const override { return now_; }

    CallbackId add_frame_callback(FrameCallback callback) override;
    void remove_frame_callback(CallbackId id) override;

    CallbackId start_periodic_timer(std::chrono::milliseconds interval, TimerCallback callback) override;
    void cancel_timer(CallbackId id) override;

    // Fires every timer that falls due within `elapsed`, in due order, with
    // now() set to each due time. Then moves to now() + elapsed and delivers
    // a single frame.
    void pump(Duration elapsed = Duration{0});

    // Delivers frames every `frame_interval` until `total` has elapsed.
    void pump_frames(Duration total, Duration frame_interval = std::chrono::milliseconds(16));

    // Pumps frames until no frame callback or timer remains. Returns false if
    // `limit` elapses first.
    bool pump_until_idle(Duration frame_interval = std::chrono::milliseconds(16),
        Duration limit = std::chrono::seconds(10));

    std::size_t frame_callback_count() const { return frame_callbacks_.size(); }
    std::size_t timer_count() const { return timers_.size(); }
    std::size_t frames_delivered() const { return frames_delivered_; }

private:
    struct Timer {
        Duration interval{0};
        Timestamp next_due{0};
        TimerCallback callback;
    };

    void deliver_frame();
    bool fire_next_timer(Timestamp until);

    Timestamp now_{0};
    CallbackId next_id_ = 1;
    std::map<CallbackId, FrameCallback> frame_callbacks_;
    std::map<CallbackId, Timer> timers_;
    std::size_t frames_delivered_ = 0;
};

} // namespace marker_motion
