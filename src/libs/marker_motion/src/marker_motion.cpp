#include <marker_motion/marker_motion.hpp>
#include <marker_motion/frame_tick_source.hpp>
#include <marker_motion/motion_log.hpp>
#include <marker_motion/timer_tick_source.hpp>
#include <utility>

namespace marker_motion {

MarkerMotion::MarkerMotion(MotionHost& host, MotionConfig config, RenderCallback on_render)
    : host_(host)
    , config_(std::move(config))
    , on_render_(std::move(on_render))
{
    source_ = make_source(config_);
    store_.attach(source_.get());
}

MarkerMotion::~MarkerMotion() {
    dispose();
}

std::unique_ptr<TickSource> MarkerMotion::make_source(const MotionConfig& config) {
    auto handler = [this](Timestamp now) { on_tick(now); };
    if (config.implementation() == MotionImplementation::TimerDriven)
        return std::make_unique<TimerTickSource>(host_, config, std::move(handler));
    return std::make_unique<FrameTickSource>(host_, config, std::move(handler));
}

void MarkerMotion::update(const std::vector<marker_model::Marker>& markers) {
    if (disposed_) return;
    store_.apply_diff(markers);
    emit();
}

void MarkerMotion::update(const std::vector<marker_model::Marker>& markers, const MotionConfig& config) {
    if (disposed_) return;
    set_config(config);
    update(markers);
}

void MarkerMotion::set_config(const MotionConfig& config) {
    if (disposed_) return;
    config_ = config;

    if (source_ && source_->implementation() == config.implementation()) {
        source_->reconfigure(config);
        return;
    }

    motion_logger()->debug("switching motion implementation to {} active={}",
        to_string(config.implementation()), store_.active_count());
    if (source_) {
        source_->stop();
        retired_sources_.push_back(std::move(source_));
    }
    source_ = make_source(config);
    store_.attach(source_.get());
}

void MarkerMotion::on_tick(Timestamp now) {
    if (disposed_) return;
    retired_sources_.clear();
    if (store_.tick(now)) emit();
}

void MarkerMotion::emit() {
    if (disposed_ || !on_render_) return;
    on_render_(store_.rendered_snapshot());
}

void MarkerMotion::dispose() {
    if (disposed_) return;
    disposed_ = true;
    if (source_) source_->stop();
    store_.attach(nullptr);
    store_.clear();
    // source_ lives until destruction: dispose() may run inside its dispatch.
    motion_logger()->debug("marker motion disposed");
}

} // namespace marker_motion
