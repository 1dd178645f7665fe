#include <chart_render/renderer.hpp>
#include <canvas/overlay.hpp>
#include <canvas/zoom.hpp>
#include <svg_scene/element.hpp>
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace chart_render {

namespace {

const unsigned int default_fill = IM_COL32(200, 200, 200, 255);
const unsigned int default_stroke = IM_COL32(90, 90, 95, 255);
const unsigned int text_color = IM_COL32(30, 30, 30, 255);
const float line_thickness = 1.5f;

// Uniform scale plus translation; the chart never rotates or skews.
struct Affine {
    double k = 1.0;
    double x = 0.0;
    double y = 0.0;

    ImVec2 apply(double px, double py) const {
        return ImVec2(static_cast<float>(px * k + x), static_cast<float>(py * k + y));
    }
    Affine then(double tx, double ty, double s) const {
        Affine out;
        out.k = k * s;
        out.x = x + tx * k;
        out.y = y + ty * k;
        return out;
    }
};

double number(const svg_scene::Element& e, const char* name, double fallback = 0.0) {
    const std::string v = e.attr(name);
    if (v.empty()) return fallback;
    char* end = nullptr;
    const double d = std::strtod(v.c_str(), &end);
    return end == v.c_str() ? fallback : d;
}

Affine local_transform(const Affine& parent, const svg_scene::Element& e) {
    const std::string t = e.attr("transform");
    if (t.empty()) return parent;
    double tx = 0, ty = 0, s = 1;
    const auto tp = t.find("translate(");
    if (tp != std::string::npos && std::sscanf(t.c_str() + tp, "translate(%lf,%lf)", &tx, &ty) != 2) {
        tx = ty = 0;
    }
    const auto sp = t.find("scale(");
    if (sp != std::string::npos && std::sscanf(t.c_str() + sp, "scale(%lf)", &s) != 1) {
        s = 1;
    }
    return parent.then(tx, ty, s);
}

unsigned int resolve_paint(const svg_scene::Element& svg, const std::string& value, unsigned int fallback) {
    if (value.rfind("url(#", 0) == 0 && value.size() > 6) {
        const std::string id = value.substr(5, value.size() - 6);
        const svg_scene::Element* server = svg.find_by_id(id);
        if (server && !server->children().empty())
            return parse_color(server->children().front()->attr("stop-color"), fallback);
        return fallback;
    }
    return parse_color(value, fallback);
}

std::string collect_text(const svg_scene::Element& e) {
    std::string out = e.text();
    for (const auto& child : e.children()) {
        if (child->tag() == "tspan") out += collect_text(*child);
    }
    return out;
}

void render_element(ImDrawList* dl, const svg_scene::Element& svg, const svg_scene::Element& e, const Affine& parent) {
    const Affine m = local_transform(parent, e);
    const std::string& tag = e.tag();

    if (tag == "defs" || tag == "title") return;

    if (tag == "rect") {
        const double x = number(e, "x"), y = number(e, "y");
        const ImVec2 min_pt = m.apply(x, y);
        const ImVec2 max_pt = m.apply(x + number(e, "width"), y + number(e, "height"));
        const float rounding = static_cast<float>(number(e, "rx") * m.k);
        dl->AddRectFilled(min_pt, max_pt, resolve_paint(svg, e.attr("fill"), default_fill), rounding);
        dl->AddRect(min_pt, max_pt, default_stroke, rounding, 0, line_thickness);
    } else if (tag == "circle") {
        const ImVec2 center = m.apply(number(e, "cx"), number(e, "cy"));
        const float radius = static_cast<float>(number(e, "r") * m.k);
        dl->AddCircleFilled(center, radius, resolve_paint(svg, e.attr("fill"), default_fill));
    } else if (tag == "line") {
        dl->AddLine(m.apply(number(e, "x1"), number(e, "y1")), m.apply(number(e, "x2"), number(e, "y2")),
            resolve_paint(svg, e.attr("stroke"), default_stroke), line_thickness);
    } else if (tag == "image") {
        const double x = number(e, "x"), y = number(e, "y");
        const double w = number(e, "width"), h = number(e, "height");
        const ImVec2 center = m.apply(x + w * 0.5, y + h * 0.5);
        dl->AddCircle(center, static_cast<float>(std::min(w, h) * 0.5 * m.k), default_stroke, 0, line_thickness);
    } else if (tag == "text") {
        const std::string label = collect_text(e);
        if (!label.empty()) {
            const ImVec2 anchor = m.apply(number(e, "x"), number(e, "y"));
            const ImVec2 size = ImGui::CalcTextSize(label.c_str());
            dl->AddText(ImVec2(anchor.x - size.x * 0.5f, anchor.y - size.y * 0.5f), text_color, label.c_str());
        }
        return;
    }

    for (const auto& child : e.children())
        render_element(dl, svg, *child, m);
}

} // namespace

unsigned int parse_color(const std::string& value, unsigned int fallback) {
    if (value.size() != 7 || value[0] != '#') return fallback;
    unsigned int r = 0, g = 0, b = 0;
    if (std::sscanf(value.c_str() + 1, "%02x%02x%02x", &r, &g, &b) != 3) return fallback;
    return IM_COL32(r, g, b, 255);
}

void render_scene(ImDrawList* draw_list,
    const svg_scene::Element& svg,
    const svg_scene::Element& content,
    const canvas::ZoomTransform& transform,
    float origin_x, float origin_y)
{
    if (!draw_list) return;
    Affine root;
    root.x = origin_x;
    root.y = origin_y;
    const Affine view = root.then(transform.x, transform.y, transform.k);
    // Children only: the group's own transform attribute mirrors the zoom state.
    for (const auto& child : content.children())
        render_element(draw_list, svg, *child, view);
}

void render_overlay(ImDrawList* draw_list, const canvas::HintOverlay& overlay,
    float region_x, float region_y, float region_width)
{
    if (!draw_list || !overlay.visible() || overlay.text().empty()) return;
    const float alpha = static_cast<float>(std::clamp(overlay.opacity(), 0.0, 1.0));
    if (alpha <= 0.0f) return;

    const ImVec2 size = ImGui::CalcTextSize(overlay.text().c_str());
    const float pad = 12.0f;
    const ImVec2 min_pt(region_x + (region_width - size.x) * 0.5f - pad, region_y + 20.0f);
    const ImVec2 max_pt(min_pt.x + size.x + pad * 2, min_pt.y + size.y + pad * 2);
    const int a = static_cast<int>(alpha * 200.0f);
    draw_list->AddRectFilled(min_pt, max_pt, IM_COL32(0, 0, 0, a), 6.0f);
    draw_list->AddText(ImVec2(min_pt.x + pad, min_pt.y + pad),
        IM_COL32(255, 255, 255, static_cast<int>(alpha * 255.0f)), overlay.text().c_str());
}

} // namespace chart_render
