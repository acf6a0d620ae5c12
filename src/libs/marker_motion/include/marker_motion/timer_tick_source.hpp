#pragma once

#include <marker_motion/tick_source.hpp>
#include <cstdint>

namespace marker_motion {

// Ticks on a periodic host timer every config.frame_interval(). Progress is
// linear; a leg no longer than one interval lands on its target at the first
// tick. Each schedule gets a generation so a superseded timer cannot emit.
class TimerTickSource : public TickSource {
public:
    TimerTickSource(MotionHost& host, MotionConfig config, TickHandler on_tick);
    ~TimerTickSource() override;

    MotionImplementation implementation() const override { return MotionImplementation::TimerDriven; }
    LegProgress progress(const MarkerAnimation& state, Timestamp now) const override;

    void reconfigure(const MotionConfig& config) override;

    std::uint64_t generation() const { return generation_; }

protected:
    void subscribe() override;
    void unsubscribe() override;

private:
    MotionHost::CallbackId timer_id_ = 0;
    std::uint64_t generation_ = 0;
};

} // namespace marker_motion
