#pragma once

#include <marker_model/types.hpp>
#include <marker_motion/marker_store.hpp>
#include <marker_motion/motion_config.hpp>
#include <marker_motion/motion_host.hpp>
#include <marker_motion/tick_source.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace marker_motion {

// Animates marker positions between successive marker collections.
//
// Every update() and every tick that moves a marker ends with one call to the
// render callback carrying the complete marker set. New markers appear at
// their position, missing ones vanish, and moved ones glide from where they
// are currently drawn to their new position.
class MarkerMotion {
public:
    using RenderCallback = std::function<void(const std::vector<marker_model::Marker>&)>;

    MarkerMotion(MotionHost& host, MotionConfig config, RenderCallback on_render);
    ~MarkerMotion();

    MarkerMotion(const MarkerMotion&) = delete;
    MarkerMotion& operator=(const MarkerMotion&) = delete;

    void update(const std::vector<marker_model::Marker>& markers);
    // Applies `config` before diffing `markers`.
    void update(const std::vector<marker_model::Marker>& markers, const MotionConfig& config);

    void set_config(const MotionConfig& config);
    const MotionConfig& config() const { return config_; }

    std::vector<marker_model::Marker> rendered() const { return store_.rendered_snapshot(); }
    const MarkerStore& store() const { return store_; }
    std::size_t active_animation_count() const { return store_.active_count(); }
    bool is_ticking() const { return source_ && source_->running(); }
    std::size_t retired_source_count() const { return retired_sources_.size(); }

    // Cancels the clock subscription and drops all markers. Nothing is
    // emitted afterwards. Safe to call more than once.
    void dispose();
    bool disposed() const { return disposed_; }

private:
    std::unique_ptr<TickSource> make_source(const MotionConfig& config);
    void on_tick(Timestamp now);
    void emit();

    MotionHost& host_;
    MotionConfig config_;
    RenderCallback on_render_;
    MarkerStore store_;
    std::unique_ptr<TickSource> source_;
    // Sources replaced while one of them may still be dispatching; freed on
    // the next tick of the current source.
    std::vector<std::unique_ptr<TickSource>> retired_sources_;
    bool disposed_ = false;
};

} // namespace marker_motion
