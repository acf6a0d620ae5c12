#include "sdl_motion_host.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <utility>
#include <vector>

marker_motion::Timestamp SdlMotionHost::now() const {
    return std::chrono::duration_cast<marker_motion::Timestamp>(std::chrono::nanoseconds(SDL_GetTicksNS()));
}

marker_motion::MotionHost::CallbackId SdlMotionHost::add_frame_callback(FrameCallback callback) {
    const CallbackId id = next_id_++;
    frame_callbacks_.emplace(id, std::move(callback));
    return id;
}

void SdlMotionHost::remove_frame_callback(CallbackId id) {
    frame_callbacks_.erase(id);
}

marker_motion::MotionHost::CallbackId SdlMotionHost::start_periodic_timer(std::chrono::milliseconds interval,
    TimerCallback callback)
{
    const CallbackId id = next_id_++;
    Timer t;
    t.interval = std::max<marker_motion::Duration>(interval, std::chrono::milliseconds(1));
    t.next_due = now() + t.interval;
    t.callback = std::move(callback);
    timers_.emplace(id, std::move(t));
    return id;
}

void SdlMotionHost::cancel_timer(CallbackId id) {
    timers_.erase(id);
}

void SdlMotionHost::run_frame() {
    const marker_motion::Timestamp frame_time = now();

    std::vector<CallbackId> due;
    for (const auto& kv : timers_)
        if (kv.second.next_due <= frame_time) due.push_back(kv.first);
    for (const CallbackId id : due) {
        auto it = timers_.find(id);
        if (it == timers_.end()) continue;
        // A slow frame fires a timer once and skips the missed periods.
        Timer& t = it->second;
        while (t.next_due <= frame_time)
            t.next_due += t.interval;
        const TimerCallback callback = t.callback;
        callback(frame_time);
    }

    std::vector<CallbackId> ids;
    ids.reserve(frame_callbacks_.size());
    for (const auto& kv : frame_callbacks_)
        ids.push_back(kv.first);
    for (const CallbackId id : ids) {
        const auto it = frame_callbacks_.find(id);
        if (it == frame_callbacks_.end()) continue;
        const FrameCallback callback = it->second;
        callback(frame_time);
    }
}
