#include <marker_motion/tick_source.hpp>
#include <marker_motion/motion_log.hpp>
#include <utility>

namespace marker_motion {

TickSource::TickSource(MotionHost& host, MotionConfig config, TickHandler on_tick)
    : host_(host)
    , config_(std::move(config))
    , on_tick_(std::move(on_tick))
{
}

void TickSource::retain() {
    if (use_count_++ == 0 && !running_) {
        running_ = true;
        subscribe();
        motion_logger()->debug("{} clock subscribed", to_string(implementation()));
    }
}

void TickSource::release() {
    if (use_count_ == 0) return;
    if (--use_count_ == 0) stop();
}

void TickSource::stop() {
    use_count_ = 0;
    if (!running_) return;
    running_ = false;
    unsubscribe();
    motion_logger()->debug("{} clock unsubscribed", to_string(implementation()));
}

void TickSource::reconfigure(const MotionConfig& config) {
    config_ = config;
}

void TickSource::dispatch(Timestamp now) {
    if (!running_) return;
    if (on_tick_) on_tick_(now);
}

} // namespace marker_motion
