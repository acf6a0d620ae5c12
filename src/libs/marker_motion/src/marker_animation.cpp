#include <marker_motion/marker_animation.hpp>

namespace marker_motion {

MarkerAnimation MarkerAnimation::pinned(const marker_model::LatLng& position) {
    MarkerAnimation s;
    s.start = position;
    s.target = position;
    s.current = position;
    return s;
}

void MarkerAnimation::retarget(const marker_model::LatLng& new_target, Timestamp now) {
    start = current;
    target = new_target;
    start_time = now;
    active = true;
    ++leg;
}

marker_model::LatLng lerp(const marker_model::LatLng& a, const marker_model::LatLng& b, double t) {
    return marker_model::LatLng{
        a.latitude + (b.latitude - a.latitude) * t,
        a.longitude + (b.longitude - a.longitude) * t,
    };
}

} // namespace marker_motion
