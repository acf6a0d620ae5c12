#include <marker_motion/frame_tick_source.hpp>
#include <algorithm>
#include <utility>

namespace marker_motion {

FrameTickSource::FrameTickSource(MotionHost& host, MotionConfig config, TickHandler on_tick)
    : TickSource(host, std::move(config), std::move(on_tick))
{
}

FrameTickSource::~FrameTickSource() {
    stop();
}

void FrameTickSource::subscribe() {
    frame_callback_id_ = host_.add_frame_callback([this](Timestamp now) { dispatch(now); });
}

void FrameTickSource::unsubscribe() {
    host_.remove_frame_callback(frame_callback_id_);
    frame_callback_id_ = 0;
}

LegProgress FrameTickSource::progress(const MarkerAnimation& state, Timestamp now) const {
    const Duration duration = config_.duration();
    if (duration.count() <= 0) return LegProgress{1.0, true};

    const Duration elapsed = now - state.start_time;
    const double fraction = std::clamp(
        static_cast<double>(elapsed.count()) / static_cast<double>(duration.count()), 0.0, 1.0);
    if (fraction >= 1.0) return LegProgress{1.0, true};
    return LegProgress{config_.curve().transform(fraction), false};
}

} // namespace marker_motion
