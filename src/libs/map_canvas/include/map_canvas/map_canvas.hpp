#pragma once

#include <marker_model/types.hpp>
#include <string>
#include <vector>

struct ImVec2;

namespace map_canvas {

// Pannable, zoomable view that draws whatever marker set it was last handed.
// Positions are projected with spherical Web Mercator into world pixels at
// zoom 1.
class MapCanvas {
public:
    MapCanvas();
    ~MapCanvas();

    void set_markers(const std::vector<marker_model::Marker>& markers);
    const std::vector<marker_model::Marker>& markers() const { return markers_; }

    void set_grid_step(float step) { grid_step_ = step; }
    float grid_step() const { return grid_step_; }

    void pan(float dx, float dy);
    void zoom_at(float screen_x, float screen_y, float zoom_delta);

    void screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const;
    void world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const;

    // Centers the view on `position` for a region of the given size.
    void focus_on(const marker_model::LatLng& position, float region_width, float region_height);
    float zoom() const { return zoom_; }

    bool update_and_draw(float region_width, float region_height);

private:
    void draw_grid(ImVec2 region_min, ImVec2 region_max);
    void draw_markers();
    void handle_input(float region_width, float region_height);

    std::vector<marker_model::Marker> markers_;
    std::string hovered_marker_id_;
    float offset_x_ = 0;
    float offset_y_ = 0;
    float zoom_ = 1.0f;
    float grid_step_ = 40.0f;
    bool dragging_ = false;
};

// Web Mercator projection scaled so the whole world spans `world_size` pixels.
void project(const marker_model::LatLng& position, double world_size, double& x, double& y);

} // namespace map_canvas
