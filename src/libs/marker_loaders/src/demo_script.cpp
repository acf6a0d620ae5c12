#include <marker_loaders/json_loader.hpp>
#include <cmath>

namespace marker_loaders {

MarkerScript demo_marker_script() {
    MarkerScript out;
    out.config = marker_motion::MotionConfig(marker_motion::MotionImplementation::FrameDriven,
        std::chrono::milliseconds(1200), marker_motion::curves::ease_in_out());

    auto marker = [](const char* id, double lat, double lng, double rotation, int z_index, const char* title) {
        marker_model::Marker m;
        m.id = id;
        m.position = marker_model::LatLng{lat, lng};
        m.rotation = rotation;
        m.z_index = z_index;
        m.info_window.title = title;
        return m;
    };

    const double kPi = 3.14159265358979323846;
    const int step_count = 12;
    for (int i = 0; i < step_count; ++i) {
        ScriptStep step;
        step.at = std::chrono::milliseconds(i * 1500);

        // Loop route around a centre point.
        const double angle = 2.0 * kPi * static_cast<double>(i) / static_cast<double>(step_count);
        step.markers.push_back(marker("bus-1", 37.7749 + 0.01 * std::sin(angle), -122.4194 + 0.01 * std::cos(angle),
            angle * 180.0 / kPi, 2, "Bus 1"));
        // Back and forth along a line.
        const double shuttle = (i % 2 == 0) ? 0.0 : 0.015;
        step.markers.push_back(marker("shuttle", 37.7649 + shuttle, -122.4294 + shuttle, 45.0, 1, "Shuttle"));
        // Parked marker, payload changes only.
        auto depot = marker("depot", 37.7799, -122.4094, 0.0, 0, "Depot");
        depot.alpha = (i % 3 == 0) ? 0.5 : 1.0;
        step.markers.push_back(depot);
        // Comes and goes.
        if (i % 4 < 2)
            step.markers.push_back(marker("ferry", 37.7949 - 0.004 * (i % 4), -122.3994, 90.0, 3, "Ferry"));

        out.steps.push_back(std::move(step));
    }

    // Switch to timer-driven ticking half way through.
    out.steps[step_count / 2].config = marker_motion::MotionConfig(
        marker_motion::MotionImplementation::TimerDriven, std::chrono::milliseconds(1200),
        marker_motion::Curve::linear(), 30);
    return out;
}

} // namespace marker_loaders
