#pragma once

#include <string>

struct ImDrawList;

namespace svg_scene {
class Element;
}
namespace canvas {
struct ZoomTransform;
class HintOverlay;
}

namespace chart_render {

// Draws the content group of a chart surface. Supports the subset the chart
// uses: g (translate/scale), rect, circle, line, text/tspan and image as a
// placeholder frame. Fills given as url(#id) use the first stop color of the
// referenced gradient.
void render_scene(ImDrawList* draw_list,
    const svg_scene::Element& svg,
    const svg_scene::Element& content,
    const canvas::ZoomTransform& transform,
    float origin_x, float origin_y);

// Centered hint box at the top of the region, faded by the overlay opacity.
void render_overlay(ImDrawList* draw_list, const canvas::HintOverlay& overlay,
    float region_x, float region_y, float region_width);

unsigned int parse_color(const std::string& value, unsigned int fallback);

} // namespace chart_render
