#include <marker_motion/timer_tick_source.hpp>
#include <marker_motion/motion_log.hpp>
#include <algorithm>
#include <utility>

namespace marker_motion {

TimerTickSource::TimerTickSource(MotionHost& host, MotionConfig config, TickHandler on_tick)
    : TickSource(host, std::move(config), std::move(on_tick))
{
}

TimerTickSource::~TimerTickSource() {
    stop();
}

void TimerTickSource::subscribe() {
    const std::uint64_t generation = ++generation_;
    timer_id_ = host_.start_periodic_timer(config_.frame_interval(), [this, generation](Timestamp now) {
        if (generation != generation_) return;
        dispatch(now);
    });
}

void TimerTickSource::unsubscribe() {
    ++generation_;
    host_.cancel_timer(timer_id_);
    timer_id_ = 0;
}

void TimerTickSource::reconfigure(const MotionConfig& config) {
    const auto previous_interval = config_.frame_interval();
    TickSource::reconfigure(config);
    if (!running() || previous_interval == config_.frame_interval()) return;

    unsubscribe();
    subscribe();
    motion_logger()->debug("timer rescheduled interval_ms={} generation={}",
        config_.frame_interval().count(), generation_);
}

LegProgress TimerTickSource::progress(const MarkerAnimation& state, Timestamp now) const {
    const Duration duration = config_.duration();
    if (duration <= config_.frame_interval()) return LegProgress{1.0, true};

    const Duration elapsed = now - state.start_time;
    const double fraction = std::clamp(
        static_cast<double>(elapsed.count()) / static_cast<double>(duration.count()), 0.0, 1.0);
    if (fraction >= 1.0) return LegProgress{1.0, true};
    return LegProgress{fraction, false};
}

} // namespace marker_motion
