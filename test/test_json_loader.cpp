#include <gtest/gtest.h>
#include <marker_loaders/json_loader.hpp>
#include <set>
#include <sstream>

using namespace std::chrono_literals;
using marker_loaders::load_marker_script_from_json;
using marker_loaders::load_markers_from_json;
using marker_loaders::load_motion_config_from_json;
using marker_model::LatLng;
using marker_model::Offset;
using marker_motion::MotionConfigError;
using marker_motion::MotionImplementation;

// ============================================================================
// Test Suite: JsonLoader_Markers
// ============================================================================

TEST(JsonLoader_Markers, ParsesEveryField) {
    std::istringstream in(R"([
        { "id": "bus", "position": [37.5, -122.25], "rotation": 15, "alpha": 0.25,
          "anchor": [0.1, 0.9], "draggable": true, "consume_tap_events": true, "flat": true,
          "visible": false, "z_index": 4,
          "info_window": { "title": "Bus", "snippet": "Line 5", "anchor": [0.5, 0.2] } }
    ])");
    const auto markers = load_markers_from_json(in);
    ASSERT_TRUE(markers.has_value());
    ASSERT_EQ(markers->size(), 1u);

    const auto& m = markers->front();
    EXPECT_EQ(m.id, "bus");
    EXPECT_EQ(m.position, (LatLng{37.5, -122.25}));
    EXPECT_EQ(m.rotation, 15);
    EXPECT_EQ(m.alpha, 0.25);
    EXPECT_EQ(m.anchor, (Offset{0.1, 0.9}));
    EXPECT_TRUE(m.draggable);
    EXPECT_TRUE(m.consume_tap_events);
    EXPECT_TRUE(m.flat);
    EXPECT_FALSE(m.visible);
    EXPECT_EQ(m.z_index, 4);
    EXPECT_EQ(m.info_window.title, "Bus");
    EXPECT_EQ(m.info_window.snippet, "Line 5");
    EXPECT_EQ(m.info_window.anchor, (Offset{0.5, 0.2}));
}

TEST(JsonLoader_Markers, MissingOptionalFieldsUseDefaults) {
    std::istringstream in(R"([{ "id": "a", "position": [1, 2] }])");
    const auto markers = load_markers_from_json(in);
    ASSERT_TRUE(markers.has_value());

    marker_model::Marker expected;
    expected.id = "a";
    expected.position = LatLng{1, 2};
    EXPECT_EQ(markers->front(), expected);
}

TEST(JsonLoader_Markers, EmptyArrayIsValid) {
    std::istringstream in("[]");
    const auto markers = load_markers_from_json(in);
    ASSERT_TRUE(markers.has_value());
    EXPECT_TRUE(markers->empty());
}

TEST(JsonLoader_Markers, MalformedInputYieldsNothing) {
    std::istringstream truncated(R"([{ "id": "a", "position": [1, )");
    EXPECT_FALSE(load_markers_from_json(truncated).has_value());

    std::istringstream missing_id(R"([{ "position": [1, 2] }])");
    EXPECT_FALSE(load_markers_from_json(missing_id).has_value());

    std::istringstream short_position(R"([{ "id": "a", "position": [1] }])");
    EXPECT_FALSE(load_markers_from_json(short_position).has_value());

    std::istringstream not_array(R"({ "id": "a" })");
    EXPECT_FALSE(load_markers_from_json(not_array).has_value());
}

TEST(JsonLoader_Markers, ZIndexOutsideIntRangeYieldsNothing) {
    std::istringstream in(R"([{ "id": "a", "position": [1, 2], "z_index": 4294967297 }])");
    EXPECT_FALSE(load_markers_from_json(in).has_value());
}

// ============================================================================
// Test Suite: JsonLoader_Config
// ============================================================================

TEST(JsonLoader_Config, ParsesTimerConfig) {
    std::istringstream in(R"({ "implementation": "timer", "duration_ms": 750, "frame_rate": 30 })");
    const auto config = load_motion_config_from_json(in);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->implementation(), MotionImplementation::TimerDriven);
    EXPECT_EQ(config->duration(), marker_motion::Duration(750ms));
    EXPECT_EQ(config->frame_rate(), 30);
    EXPECT_TRUE(config->curve().is_linear());
}

TEST(JsonLoader_Config, EmptyObjectIsDefaultFrameConfig) {
    std::istringstream in("{}");
    const auto config = load_motion_config_from_json(in);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->implementation(), MotionImplementation::FrameDriven);
    EXPECT_EQ(config->duration(), marker_motion::MotionConfig::kDefaultDuration);
    EXPECT_EQ(config->frame_rate(), 60);
}

TEST(JsonLoader_Config, NamedCurveIsResolved) {
    std::istringstream in(R"({ "curve": "ease_in" })");
    const auto config = load_motion_config_from_json(in);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->curve().name(), "ease_in");
}

TEST(JsonLoader_Config, UnknownNamesYieldNothing) {
    std::istringstream bad_curve(R"({ "curve": "wobble" })");
    EXPECT_FALSE(load_motion_config_from_json(bad_curve).has_value());

    std::istringstream bad_implementation(R"({ "implementation": "vsync" })");
    EXPECT_FALSE(load_motion_config_from_json(bad_implementation).has_value());
}

TEST(JsonLoader_Config, FrameRateOutsideIntRangeYieldsNothing) {
    // 2^32 + 60 must not wrap around to a valid frame rate.
    std::istringstream wrapping(R"({ "implementation": "timer", "frame_rate": 4294967356 })");
    EXPECT_FALSE(load_motion_config_from_json(wrapping).has_value());

    std::istringstream negative_wrap(R"({ "implementation": "timer", "frame_rate": -4294967236 })");
    EXPECT_FALSE(load_motion_config_from_json(negative_wrap).has_value());

    std::istringstream fractional(R"({ "implementation": "timer", "frame_rate": 30.5 })");
    EXPECT_FALSE(load_motion_config_from_json(fractional).has_value());
}

TEST(JsonLoader_Config, InvalidCombinationThrows) {
    std::istringstream fps_out_of_range(R"({ "implementation": "timer", "frame_rate": 240 })");
    EXPECT_THROW(load_motion_config_from_json(fps_out_of_range), MotionConfigError);

    std::istringstream curved_timer(R"({ "implementation": "timer", "curve": "ease_out" })");
    EXPECT_THROW(load_motion_config_from_json(curved_timer), MotionConfigError);

    std::istringstream negative(R"({ "duration_ms": -5 })");
    EXPECT_THROW(load_motion_config_from_json(negative), MotionConfigError);
}

// ============================================================================
// Test Suite: JsonLoader_Script
// ============================================================================

TEST(JsonLoader_Script, StepsAreOrderedByTime) {
    std::istringstream in(R"({
        "config": { "duration_ms": 400 },
        "steps": [
            { "at_ms": 900, "markers": [] },
            { "at_ms": 0, "markers": [{ "id": "1", "position": [0, 0] }] },
            { "at_ms": 300, "config": { "implementation": "timer", "frame_rate": 10 },
              "markers": [{ "id": "1", "position": [1, 1] }] }
        ]
    })");
    const auto script = load_marker_script_from_json(in);
    ASSERT_TRUE(script.has_value());
    EXPECT_EQ(script->config.duration(), marker_motion::Duration(400ms));

    ASSERT_EQ(script->steps.size(), 3u);
    EXPECT_EQ(script->steps[0].at, 0ms);
    EXPECT_EQ(script->steps[1].at, 300ms);
    EXPECT_EQ(script->steps[2].at, 900ms);
    EXPECT_FALSE(script->steps[0].config.has_value());
    ASSERT_TRUE(script->steps[1].config.has_value());
    EXPECT_EQ(script->steps[1].config->frame_rate(), 10);
    EXPECT_TRUE(script->steps[2].markers.empty());
}

TEST(JsonLoader_Script, StepWithBadMarkerRejectsScript) {
    std::istringstream in(R"({ "steps": [ { "at_ms": 0, "markers": [{ "id": 3 }] } ] })");
    EXPECT_FALSE(load_marker_script_from_json(in).has_value());
}

TEST(JsonLoader_Script, MissingStepsRejectsScript) {
    std::istringstream in(R"({ "config": {} })");
    EXPECT_FALSE(load_marker_script_from_json(in).has_value());
}

TEST(JsonLoader_Script, MissingFileYieldsNothing) {
    EXPECT_FALSE(marker_loaders::load_marker_script_from_json_file("/nonexistent/script.json").has_value());
}

TEST(JsonLoader_Script, DemoScriptIsWellFormed) {
    const auto script = marker_loaders::demo_marker_script();
    ASSERT_FALSE(script.steps.empty());

    std::set<std::string> ids;
    auto previous = script.steps.front().at;
    bool switches_implementation = false;
    for (const auto& step : script.steps) {
        EXPECT_GE(step.at, previous);
        previous = step.at;
        for (const auto& m : step.markers) ids.insert(m.id);
        if (step.config && step.config->implementation() != script.config.implementation())
            switches_implementation = true;
    }
    EXPECT_GE(ids.size(), 3u);
    EXPECT_TRUE(switches_implementation);
}
