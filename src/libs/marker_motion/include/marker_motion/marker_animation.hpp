#pragma once

#include <marker_model/types.hpp>
#include <marker_motion/motion_config.hpp>
#include <cstdint>

namespace marker_motion {

// One marker's current leg. Positions lie on the start -> target segment.
struct MarkerAnimation {
    marker_model::LatLng start;
    marker_model::LatLng target;
    marker_model::LatLng current;
    Timestamp start_time{0};
    std::uint64_t leg = 0;
    bool active = false;

    static MarkerAnimation pinned(const marker_model::LatLng& position);

    // Begins a new leg from the current position; the previous leg is dropped.
    void retarget(const marker_model::LatLng& new_target, Timestamp now);
};

// Progress of a leg at a given time as decided by a backend.
struct LegProgress {
    double eased = 0.0;
    bool complete = false;
};

marker_model::LatLng lerp(const marker_model::LatLng& a, const marker_model::LatLng& b, double t);

} // namespace marker_motion
