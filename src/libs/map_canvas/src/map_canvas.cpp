#include <map_canvas/map_canvas.hpp>
#include "imgui.h"
#include <algorithm>
#include <cmath>

namespace {

const double kPi = 3.14159265358979323846;
// 256 px tiles at map zoom level 14.
const double kWorldSize = 256.0 * 16384.0;
const double kMaxLatitude = 85.05112878;

const float marker_radius = 9.0f;
const float min_zoom = 0.05f;
const float max_zoom = 20.0f;

ImU32 marker_color(const marker_model::Marker& m, bool hovered) {
    const int a = static_cast<int>(std::clamp(m.alpha, 0.0, 1.0) * 255.0);
    if (hovered) return IM_COL32(255, 210, 90, a);
    if (m.flat) return IM_COL32(120, 200, 140, a);
    return IM_COL32(230, 80, 70, a);
}

} // namespace

namespace map_canvas {

void project(const marker_model::LatLng& position, double world_size, double& x, double& y) {
    const double lat = std::clamp(position.latitude, -kMaxLatitude, kMaxLatitude);
    const double siny = std::sin(lat * kPi / 180.0);
    x = world_size * (0.5 + position.longitude / 360.0);
    y = world_size * (0.5 - std::log((1.0 + siny) / (1.0 - siny)) / (4.0 * kPi));
}

MapCanvas::MapCanvas() = default;

MapCanvas::~MapCanvas() = default;

void MapCanvas::set_markers(const std::vector<marker_model::Marker>& markers) {
    markers_ = markers;
}

void MapCanvas::pan(float dx, float dy) {
    offset_x_ += dx;
    offset_y_ += dy;
}

void MapCanvas::zoom_at(float screen_x, float screen_y, float zoom_delta) {
    float new_zoom = std::clamp(zoom_ * zoom_delta, min_zoom, max_zoom);
    float factor = new_zoom / zoom_;
    offset_x_ = screen_x - (screen_x - offset_x_) * factor;
    offset_y_ = screen_y - (screen_y - offset_y_) * factor;
    zoom_ = new_zoom;
}

void MapCanvas::screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const {
    world_x = (screen_x - offset_x_) / zoom_;
    world_y = (screen_y - offset_y_) / zoom_;
}

void MapCanvas::world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const {
    screen_x = static_cast<float>(world_x * zoom_ + offset_x_);
    screen_y = static_cast<float>(world_y * zoom_ + offset_y_);
}

void MapCanvas::focus_on(const marker_model::LatLng& position, float region_width, float region_height) {
    double wx, wy;
    project(position, kWorldSize, wx, wy);
    offset_x_ = region_width * 0.5f - static_cast<float>(wx * zoom_);
    offset_y_ = region_height * 0.5f - static_cast<float>(wy * zoom_);
}

void MapCanvas::draw_grid(ImVec2 region_min, ImVec2 region_max) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    const unsigned int grid_color = IM_COL32(60, 60, 65, 255);

    // Grid lines are fixed in screen space and scroll with the offset.
    float step = grid_step_ * zoom_;
    while (step < 16.0f) step *= 2.0f;
    while (step > 160.0f) step *= 0.5f;

    const float start_x = region_min.x + std::fmod(offset_x_ - region_min.x, step) - step;
    const float start_y = region_min.y + std::fmod(offset_y_ - region_min.y, step) - step;
    for (float x = start_x; x <= region_max.x; x += step)
        dl->AddLine(ImVec2(x, region_min.y), ImVec2(x, region_max.y), grid_color, 1.0f);
    for (float y = start_y; y <= region_max.y; y += step)
        dl->AddLine(ImVec2(region_min.x, y), ImVec2(region_max.x, y), grid_color, 1.0f);
}

void MapCanvas::draw_markers() {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    std::vector<const marker_model::Marker*> ordered;
    ordered.reserve(markers_.size());
    for (const auto& m : markers_)
        if (m.visible) ordered.push_back(&m);
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const marker_model::Marker* a, const marker_model::Marker* b) { return a->z_index < b->z_index; });

    const marker_model::Marker* hovered = nullptr;
    for (const auto* m : ordered) {
        double wx, wy;
        project(m->position, kWorldSize, wx, wy);
        float sx, sy;
        world_to_screen(wx, wy, sx, sy);

        const bool is_hovered = m->id == hovered_marker_id_;
        if (is_hovered) hovered = m;
        const ImU32 color = marker_color(*m, is_hovered);

        // Anchor (0.5, 1.0) puts the pin tip on the position.
        const float cx = sx + (0.5f - static_cast<float>(m->anchor.x)) * marker_radius * 2.0f;
        const float cy = sy + (0.5f - static_cast<float>(m->anchor.y)) * marker_radius * 2.0f;
        dl->AddCircleFilled(ImVec2(cx, cy), marker_radius, color);

        // Heading tick.
        const float heading = static_cast<float>(m->rotation * kPi / 180.0);
        dl->AddLine(ImVec2(cx, cy),
            ImVec2(cx + std::sin(heading) * marker_radius * 1.6f, cy - std::cos(heading) * marker_radius * 1.6f),
            IM_COL32(255, 255, 255, 220), 2.0f);

        const std::string& label = m->info_window.title.empty() ? m->id : m->info_window.title;
        dl->AddText(ImVec2(cx + marker_radius + 3.0f, cy - 7.0f), IM_COL32(220, 220, 225, 255), label.c_str());
    }

    if (hovered && !hovered->info_window.snippet.empty()) {
        ImGui::BeginTooltip();
        ImGui::TextUnformatted(hovered->info_window.snippet.c_str());
        ImGui::EndTooltip();
    }
}

void MapCanvas::handle_input(float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 win_min = ImGui::GetWindowPos();
    ImVec2 win_max = ImVec2(win_min.x + region_width, win_min.y + region_height);

    bool in_region = mouse.x >= win_min.x && mouse.x <= win_max.x &&
                     mouse.y >= win_min.y && mouse.y <= win_max.y;

    hovered_marker_id_.clear();
    if (in_region && !dragging_) {
        double mouse_wx, mouse_wy;
        screen_to_world(mouse.x, mouse.y, mouse_wx, mouse_wy);
        // Pins are drawn above their position, in screen pixels.
        const double pick_radius = marker_radius / zoom_;
        mouse_wy += pick_radius;
        for (const auto& m : markers_) {
            if (!m.visible) continue;
            double wx, wy;
            project(m.position, kWorldSize, wx, wy);
            const double dx = mouse_wx - wx;
            const double dy = mouse_wy - wy;
            if (dx * dx + dy * dy <= pick_radius * pick_radius * 2.0) {
                hovered_marker_id_ = m.id;
                break;
            }
        }
    }

    if (ImGui::IsMouseClicked(0) && in_region)
        dragging_ = true;
    if (ImGui::IsMouseReleased(0))
        dragging_ = false;

    if (dragging_)
        pan(io.MouseDelta.x, io.MouseDelta.y);

    if (in_region && io.MouseWheel != 0.0f) {
        float factor = io.MouseWheel > 0 ? 1.2f : 1.0f / 1.2f;
        zoom_at(mouse.x, mouse.y, factor);
    }
}

bool MapCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    handle_input(region_width, region_height);

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);

    draw_grid(region_min, region_max);
    draw_markers();
    return true;
}

} // namespace map_canvas
