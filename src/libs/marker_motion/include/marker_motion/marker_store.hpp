#pragma once

#include <marker_model/types.hpp>
#include <marker_motion/marker_animation.hpp>
#include <marker_motion/marker_diff.hpp>
#include <marker_motion/tick_source.hpp>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace marker_motion {

// Owns every live marker: its latest payload and its animation state.
// Activating a leg retains the attached tick source, finishing or dropping
// it releases the source.
class MarkerStore {
public:
    MarkerStore() = default;
    ~MarkerStore();

    MarkerStore(const MarkerStore&) = delete;
    MarkerStore& operator=(const MarkerStore&) = delete;

    // Moves the references held by active legs over to `source`. The previous
    // source is not released; the caller stops it.
    void attach(TickSource* source);
    TickSource* source() const { return source_; }

    MarkerDiff apply_diff(const std::vector<marker_model::Marker>& next);

    // Returns true if any rendered position changed.
    bool tick(Timestamp now);

    std::vector<marker_model::Marker> rendered_snapshot() const;

    const MarkerAnimation* find(const std::string& id) const;
    std::size_t size() const { return entries_.size(); }
    std::size_t active_count() const { return active_count_; }

    void clear();

private:
    struct Entry {
        marker_model::Marker payload;
        MarkerAnimation animation;
    };

    void activate(Entry& entry, const marker_model::LatLng& target, Timestamp now);
    void deactivate(Entry& entry);

    std::unordered_map<std::string, Entry> entries_;
    TickSource* source_ = nullptr;
    std::size_t active_count_ = 0;
};

} // namespace marker_motion
