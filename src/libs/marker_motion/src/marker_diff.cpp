#include <marker_motion/marker_diff.hpp>
#include <marker_motion/motion_log.hpp>
#include <algorithm>

namespace marker_motion {

MarkerDiff diff_markers(const std::unordered_map<std::string, marker_model::LatLng>& previous_targets,
    const std::vector<marker_model::Marker>& next)
{
    MarkerDiff out;

    // id -> index of its last occurrence in `next`
    std::unordered_map<std::string, std::size_t> last_index;
    last_index.reserve(next.size());
    for (std::size_t i = 0; i < next.size(); ++i) {
        auto [it, inserted] = last_index.emplace(next[i].id, i);
        if (!inserted) {
            it->second = i;
            ++out.duplicates_dropped;
        }
    }
    if (out.duplicates_dropped > 0) {
        motion_logger()->warn("marker update repeats ids; kept last occurrence, dropped={}",
            out.duplicates_dropped);
    }

    for (std::size_t i = 0; i < next.size(); ++i) {
        const auto& marker = next[i];
        if (last_index[marker.id] != i) continue;

        const auto prev = previous_targets.find(marker.id);
        if (prev == previous_targets.end())
            out.added.push_back(marker);
        else if (prev->second == marker.position)
            out.unchanged.push_back(marker);
        else
            out.moved.push_back(marker);
    }

    for (const auto& [id, target] : previous_targets) {
        if (last_index.find(id) == last_index.end())
            out.removed.push_back(id);
    }
    std::sort(out.removed.begin(), out.removed.end());

    return out;
}

} // namespace marker_motion
