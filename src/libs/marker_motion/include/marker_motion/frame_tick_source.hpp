#pragma once

#include <marker_motion/tick_source.hpp>

namespace marker_motion {

// Ticks on the host's frame callback and eases with the configured curve.
class FrameTickSource : public TickSource {
public:
    FrameTickSource(MotionHost& host, MotionConfig config, TickHandler on_tick);
    ~FrameTickSource() override;

    MotionImplementation implementation() const override { return MotionImplementation::FrameDriven; }
    LegProgress progress(const MarkerAnimation& state, Timestamp now) const override;

protected:
    void subscribe() override;
    void unsubscribe() override;

private:
    MotionHost::CallbackId frame_callback_id_ = 0;
};

} // namespace marker_motion
