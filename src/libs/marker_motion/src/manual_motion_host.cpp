#include <marker_motion/manual_motion_host.hpp>
#include <algorithm>
#include <utility>
#include <vector>

namespace marker_motion {

ManualMotionHost::ManualMotionHost(Timestamp start) : now_(start) {}

MotionHost::CallbackId ManualMotionHost::add_frame_callback(FrameCallback callback) {
    const CallbackId id = next_id_++;
    frame_callbacks_.emplace(id, std::move(callback));
    return id;
}

void ManualMotionHost::remove_frame_callback(CallbackId id) {
    frame_callbacks_.erase(id);
}

MotionHost::CallbackId ManualMotionHost::start_periodic_timer(std::chrono::milliseconds interval,
    TimerCallback callback)
{
    const CallbackId id = next_id_++;
    Timer t;
    t.interval = std::max<Duration>(interval, std::chrono::milliseconds(1));
    t.next_due = now_ + t.interval;
    t.callback = std::move(callback);
    timers_.emplace(id, std::move(t));
    return id;
}

void ManualMotionHost::cancel_timer(CallbackId id) {
    timers_.erase(id);
}

bool ManualMotionHost::fire_next_timer(Timestamp until) {
    auto due = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.next_due > until) continue;
        if (due == timers_.end() || it->second.next_due < due->second.next_due)
            due = it;
    }
    if (due == timers_.end()) return false;

    now_ = due->second.next_due;
    due->second.next_due += due->second.interval;
    // The callback may cancel this or any other timer.
    const TimerCallback callback = due->second.callback;
    callback(now_);
    return true;
}

void ManualMotionHost::deliver_frame() {
    std::vector<CallbackId> ids;
    ids.reserve(frame_callbacks_.size());
    for (const auto& kv : frame_callbacks_)
        ids.push_back(kv.first);

    for (const CallbackId id : ids) {
        const auto it = frame_callbacks_.find(id);
        if (it == frame_callbacks_.end()) continue;
        const FrameCallback callback = it->second;
        callback(now_);
    }
    ++frames_delivered_;
}

void ManualMotionHost::pump(Duration elapsed) {
    const Timestamp until = now_ + std::max(elapsed, Duration{0});
    while (fire_next_timer(until)) {
    }
    now_ = until;
    deliver_frame();
}

void ManualMotionHost::pump_frames(Duration total, Duration frame_interval) {
    if (frame_interval <= Duration{0}) frame_interval = std::chrono::milliseconds(16);
    Duration remaining = total;
    while (remaining > Duration{0}) {
        const Duration step = std::min(remaining, frame_interval);
        pump(step);
        remaining -= step;
    }
}

bool ManualMotionHost::pump_until_idle(Duration frame_interval, Duration limit) {
    if (frame_interval <= Duration{0}) frame_interval = std::chrono::milliseconds(16);
    Duration spent{0};
    while (!frame_callbacks_.empty() || !timers_.empty()) {
        if (spent >= limit) return false;
        pump(frame_interval);
        spent += frame_interval;
    }
    return true;
}

} // namespace marker_motion
