#pragma once

#include <marker_model/types.hpp>
#include <marker_motion/motion_config.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace marker_loaders {

// One timed update of a marker script. `config`, when present, is applied
// together with the markers.
struct ScriptStep {
    std::chrono::milliseconds at{0};
    std::vector<marker_model::Marker> markers;
    std::optional<marker_motion::MotionConfig> config;
};

struct MarkerScript {
    marker_motion::MotionConfig config;
    std::vector<ScriptStep> steps; // ordered by `at`
};

// Malformed input yields std::nullopt. A well-formed config that breaks the
// motion rules throws marker_motion::MotionConfigError.
std::optional<std::vector<marker_model::Marker>> load_markers_from_json(std::istream& in);
std::optional<marker_motion::MotionConfig> load_motion_config_from_json(std::istream& in);
std::optional<MarkerScript> load_marker_script_from_json(std::istream& in);
std::optional<MarkerScript> load_marker_script_from_json_file(const std::string& path);

// Built-in script used when the viewer starts without a file.
MarkerScript demo_marker_script();

} // namespace marker_loaders
