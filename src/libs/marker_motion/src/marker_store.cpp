#include <marker_motion/marker_store.hpp>
#include <marker_motion/motion_log.hpp>
#include <algorithm>

namespace marker_motion {

MarkerStore::~MarkerStore() {
    clear();
}

void MarkerStore::attach(TickSource* source) {
    source_ = source;
    if (!source_) return;
    for (std::size_t i = 0; i < active_count_; ++i)
        source_->retain();
}

MarkerDiff MarkerStore::apply_diff(const std::vector<marker_model::Marker>& next) {
    std::unordered_map<std::string, marker_model::LatLng> targets;
    targets.reserve(entries_.size());
    for (const auto& [id, entry] : entries_)
        targets.emplace(id, entry.animation.target);

    MarkerDiff diff = diff_markers(targets, next);
    const Timestamp now = source_ ? source_->now() : Timestamp{0};

    for (const auto& id : diff.removed) {
        auto it = entries_.find(id);
        if (it == entries_.end()) continue;
        deactivate(it->second);
        entries_.erase(it);
    }

    for (const auto& marker : diff.added) {
        Entry entry;
        entry.payload = marker;
        entry.animation = MarkerAnimation::pinned(marker.position);
        entries_.emplace(marker.id, std::move(entry));
    }

    for (const auto& marker : diff.unchanged)
        entries_[marker.id].payload = marker;

    for (const auto& marker : diff.moved) {
        Entry& entry = entries_[marker.id];
        entry.payload = marker;
        activate(entry, marker.position, now);
    }

    return diff;
}

void MarkerStore::activate(Entry& entry, const marker_model::LatLng& target, Timestamp now) {
    const bool was_active = entry.animation.active;
    entry.animation.retarget(target, now);
    motion_logger()->debug("retarget id={} leg={} from=({}, {}) to=({}, {})", entry.payload.id,
        entry.animation.leg, entry.animation.start.latitude, entry.animation.start.longitude,
        target.latitude, target.longitude);

    // Without a clock, or with a zero duration, the leg lands immediately so
    // the next render already shows the target.
    if (!source_ || source_->config().duration().count() <= 0) {
        if (was_active) {
            --active_count_;
            if (source_) source_->release();
        }
        entry.animation.current = target;
        entry.animation.active = false;
        return;
    }
    if (!was_active) {
        ++active_count_;
        source_->retain();
    }
}

void MarkerStore::deactivate(Entry& entry) {
    if (!entry.animation.active) return;
    entry.animation.active = false;
    --active_count_;
    if (source_) source_->release();
}

bool MarkerStore::tick(Timestamp now) {
    if (!source_) return false;

    bool changed = false;
    std::vector<Entry*> finished;
    for (auto& [id, entry] : entries_) {
        MarkerAnimation& anim = entry.animation;
        if (!anim.active) continue;

        const LegProgress p = source_->progress(anim, now);
        const marker_model::LatLng next = p.complete ? anim.target : lerp(anim.start, anim.target, p.eased);
        if (next != anim.current) {
            anim.current = next;
            changed = true;
        }
        if (p.complete) finished.push_back(&entry);
    }

    // Releasing may unsubscribe the clock, so it happens after the sweep.
    for (Entry* entry : finished)
        deactivate(*entry);
    return changed;
}

std::vector<marker_model::Marker> MarkerStore::rendered_snapshot() const {
    std::vector<marker_model::Marker> out;
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        marker_model::Marker m = entry.payload;
        m.position = entry.animation.current;
        out.push_back(std::move(m));
    }
    std::sort(out.begin(), out.end(),
        [](const marker_model::Marker& a, const marker_model::Marker& b) { return a.id < b.id; });
    return out;
}

const MarkerAnimation* MarkerStore::find(const std::string& id) const {
    const auto it = entries_.find(id);
    if (it == entries_.end()) return nullptr;
    return &it->second.animation;
}

void MarkerStore::clear() {
    for (auto& [id, entry] : entries_)
        deactivate(entry);
    entries_.clear();
    active_count_ = 0;
}

} // namespace marker_motion
