#pragma once

#include <string>
#include <vector>

namespace marker_model {

struct LatLng {
    double latitude = 0;
    double longitude = 0;

    bool operator==(const LatLng& other) const {
        return latitude == other.latitude && longitude == other.longitude;
    }
    bool operator!=(const LatLng& other) const { return !(*this == other); }
};

struct Offset {
    double x = 0;
    double y = 0;

    bool operator==(const Offset& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Offset& other) const { return !(*this == other); }
};

struct InfoWindow {
    std::string title;
    std::string snippet;
    Offset anchor{0.5, 0.0};

    bool operator==(const InfoWindow& other) const {
        return title == other.title && snippet == other.snippet && anchor == other.anchor;
    }
    bool operator!=(const InfoWindow& other) const { return !(*this == other); }
};

// Only position is animated. Every other field is display payload and is
// forwarded as-is from the latest snapshot of the marker.
struct Marker {
    std::string id;
    LatLng position;
    double rotation = 0;
    double alpha = 1.0;
    Offset anchor{0.5, 1.0};
    bool draggable = false;
    bool consume_tap_events = false;
    bool flat = false;
    bool visible = true;
    int z_index = 0;
    InfoWindow info_window;

    bool operator==(const Marker& other) const {
        return id == other.id && position == other.position && rotation == other.rotation
            && alpha == other.alpha && anchor == other.anchor && draggable == other.draggable
            && consume_tap_events == other.consume_tap_events && flat == other.flat
            && visible == other.visible && z_index == other.z_index
            && info_window == other.info_window;
    }
    bool operator!=(const Marker& other) const { return !(*this == other); }
};

using MarkerSet = std::vector<Marker>;

} // namespace marker_model
