#pragma once

#include <marker_motion/marker_animation.hpp>
#include <marker_motion/motion_config.hpp>
#include <marker_motion/motion_host.hpp>
#include <cstddef>
#include <functional>

namespace marker_motion {

// Scheduling backend. Owns one host subscription shared by every active
// animation: the first retain() subscribes, the last release() unsubscribes.
// Subclasses decide what drives ticks and how a leg progresses.
class TickSource {
public:
    using TickHandler = std::function<void(Timestamp)>;

    TickSource(MotionHost& host, MotionConfig config, TickHandler on_tick);
    virtual ~TickSource() = default;

    TickSource(const TickSource&) = delete;
    TickSource& operator=(const TickSource&) = delete;

    void retain();
    void release();
    std::size_t use_count() const { return use_count_; }
    bool running() const { return running_; }

    // Adopts a config of the same implementation. Not retroactive: in-flight
    // legs keep their start, target and start time.
    virtual void reconfigure(const MotionConfig& config);

    // Cancels the subscription; later ticks are dropped until retained again.
    void stop();

    virtual MotionImplementation implementation() const = 0;
    virtual LegProgress progress(const MarkerAnimation& state, Timestamp now) const = 0;

    Timestamp now() const { return host_.now(); }
    const MotionConfig& config() const { return config_; }

protected:
    virtual void subscribe() = 0;
    virtual void unsubscribe() = 0;

    // Called by subclasses from the host callback.
    void dispatch(Timestamp now);

    MotionHost& host_;
    MotionConfig config_;

private:
    TickHandler on_tick_;
    std::size_t use_count_ = 0;
    bool running_ = false;
};

} // namespace marker_motion
