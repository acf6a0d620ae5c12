#include <marker_loaders/json_loader.hpp>
#include <marker_motion/motion_log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>

namespace marker_loaders {

namespace {

using marker_motion::MotionConfig;
using marker_motion::MotionImplementation;

std::optional<marker_model::Offset> parse_pair(const nlohmann::json& j) {
    if (!j.is_array() || j.size() != 2 || !j[0].is_number() || !j[1].is_number()) return std::nullopt;
    return marker_model::Offset{j[0].get<double>(), j[1].get<double>()};
}

// Integer field that must fit in an int; nullopt when it does not.
std::optional<int> parse_int(const nlohmann::json& j) {
    if (!j.is_number_integer()) return std::nullopt;
    if (j.is_number_unsigned()) {
        const auto v = j.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(v);
    }
    const auto v = j.get<std::int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(v);
}

std::optional<marker_model::Marker> parse_marker(const nlohmann::json& m) {
    marker_model::Marker marker;
    if (!m.is_object()) return std::nullopt;
    if (!m.contains("id") || !m["id"].is_string()) return std::nullopt;
    marker.id = m["id"].get<std::string>();
    if (!m.contains("position")) return std::nullopt;
    const auto position = parse_pair(m["position"]);
    if (!position) return std::nullopt;
    marker.position = marker_model::LatLng{position->x, position->y};

    marker.rotation = m.contains("rotation") && m["rotation"].is_number() ? m["rotation"].get<double>() : 0.0;
    marker.alpha = m.contains("alpha") && m["alpha"].is_number() ? m["alpha"].get<double>() : 1.0;
    if (m.contains("anchor")) {
        if (const auto anchor = parse_pair(m["anchor"])) marker.anchor = *anchor;
    }
    marker.draggable = m.contains("draggable") && m["draggable"].is_boolean() && m["draggable"].get<bool>();
    marker.consume_tap_events = m.contains("consume_tap_events") && m["consume_tap_events"].is_boolean()
        && m["consume_tap_events"].get<bool>();
    marker.flat = m.contains("flat") && m["flat"].is_boolean() && m["flat"].get<bool>();
    marker.visible = !(m.contains("visible") && m["visible"].is_boolean()) || m["visible"].get<bool>();
    if (m.contains("z_index")) {
        const auto z_index = parse_int(m["z_index"]);
        if (!z_index) return std::nullopt;
        marker.z_index = *z_index;
    }

    if (m.contains("info_window") && m["info_window"].is_object()) {
        const auto& w = m["info_window"];
        marker.info_window.title = w.contains("title") && w["title"].is_string() ? w["title"].get<std::string>() : "";
        marker.info_window.snippet = w.contains("snippet") && w["snippet"].is_string()
            ? w["snippet"].get<std::string>() : "";
        if (w.contains("anchor")) {
            if (const auto anchor = parse_pair(w["anchor"])) marker.info_window.anchor = *anchor;
        }
    }
    return marker;
}

std::optional<std::vector<marker_model::Marker>> parse_markers(const nlohmann::json& j) {
    if (!j.is_array()) return std::nullopt;
    std::vector<marker_model::Marker> out;
    out.reserve(j.size());
    for (const auto& m : j) {
        auto marker = parse_marker(m);
        if (!marker) return std::nullopt;
        out.push_back(std::move(*marker));
    }
    return out;
}

std::optional<MotionConfig> parse_config(const nlohmann::json& c) {
    if (!c.is_object()) return std::nullopt;

    MotionImplementation implementation = MotionImplementation::FrameDriven;
    if (c.contains("implementation")) {
        if (!c["implementation"].is_string()) return std::nullopt;
        const auto name = c["implementation"].get<std::string>();
        if (name == "timer")
            implementation = MotionImplementation::TimerDriven;
        else if (name != "frame")
            return std::nullopt;
    }

    marker_motion::Duration duration = MotionConfig::kDefaultDuration;
    if (c.contains("duration_ms")) {
        if (!c["duration_ms"].is_number()) return std::nullopt;
        duration = std::chrono::microseconds(
            static_cast<std::int64_t>(c["duration_ms"].get<double>() * 1000.0));
    }

    marker_motion::Curve curve = marker_motion::Curve::linear();
    if (c.contains("curve")) {
        if (!c["curve"].is_string()) return std::nullopt;
        auto named = marker_motion::curves::from_name(c["curve"].get<std::string>());
        if (!named) return std::nullopt;
        curve = std::move(*named);
    }

    int frame_rate = MotionConfig::kDefaultFrameRate;
    if (c.contains("frame_rate")) {
        const auto parsed = parse_int(c["frame_rate"]);
        if (!parsed) return std::nullopt;
        frame_rate = *parsed;
    }

    return MotionConfig(implementation, duration, std::move(curve), frame_rate);
}

std::optional<MarkerScript> parse_script(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("steps") || !j["steps"].is_array()) return std::nullopt;

    MarkerScript out;
    if (j.contains("config")) {
        auto config = parse_config(j["config"]);
        if (!config) return std::nullopt;
        out.config = std::move(*config);
    }

    for (const auto& s : j["steps"]) {
        ScriptStep step;
        if (!s.is_object() || !s.contains("markers")) return std::nullopt;
        step.at = std::chrono::milliseconds(s.contains("at_ms") && s["at_ms"].is_number_integer()
            ? s["at_ms"].get<std::int64_t>() : 0);
        auto markers = parse_markers(s["markers"]);
        if (!markers) return std::nullopt;
        step.markers = std::move(*markers);
        if (s.contains("config")) {
            step.config = parse_config(s["config"]);
            if (!step.config) return std::nullopt;
        }
        out.steps.push_back(std::move(step));
    }
    std::stable_sort(out.steps.begin(), out.steps.end(),
        [](const ScriptStep& a, const ScriptStep& b) { return a.at < b.at; });
    return out;
}

template <typename T, typename Parser>
std::optional<T> parse_stream(std::istream& in, const char* what, Parser parser) {
    try {
        const nlohmann::json j = nlohmann::json::parse(in);
        auto parsed = parser(j);
        if (!parsed) marker_motion::motion_logger()->error("{} JSON has an unexpected layout", what);
        return parsed;
    } catch (const nlohmann::json::exception& e) {
        marker_motion::motion_logger()->error("cannot read {} JSON: {}", what, e.what());
        return std::nullopt;
    }
}

} // namespace

std::optional<std::vector<marker_model::Marker>> load_markers_from_json(std::istream& in) {
    return parse_stream<std::vector<marker_model::Marker>>(in, "markers", parse_markers);
}

std::optional<MotionConfig> load_motion_config_from_json(std::istream& in) {
    return parse_stream<MotionConfig>(in, "motion config", parse_config);
}

std::optional<MarkerScript> load_marker_script_from_json(std::istream& in) {
    return parse_stream<MarkerScript>(in, "marker script", parse_script);
}

std::optional<MarkerScript> load_marker_script_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        marker_motion::motion_logger()->error("cannot open marker script {}", path);
        return std::nullopt;
    }
    return load_marker_script_from_json(f);
}

} // namespace marker_loaders
