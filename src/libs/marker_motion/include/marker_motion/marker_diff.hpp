#pragma once

#include <marker_model/types.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace marker_motion {

struct MarkerDiff {
    std::vector<marker_model::Marker> added;
    std::vector<std::string> removed;                 // sorted by id
    std::vector<marker_model::Marker> moved;          // retained, new target position
    std::vector<marker_model::Marker> unchanged;      // retained, same position
    std::size_t duplicates_dropped = 0;

    bool empty() const { return added.empty() && removed.empty() && moved.empty(); }
};

// Classifies `next` against the last known target position of every live id.
// Linear in the size of both inputs. When `next` repeats an id the last
// occurrence wins and the earlier ones are dropped.
MarkerDiff diff_markers(const std::unordered_map<std::string, marker_model::LatLng>& previous_targets,
    const std::vector<marker_model::Marker>& next);

} // namespace marker_motion
