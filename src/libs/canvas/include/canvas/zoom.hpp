#pragma once

#include <string>

namespace svg_scene {
class Element;
}

namespace canvas {

struct ZoomTransform {
    double k = 1.0;
    double x = 0.0;
    double y = 0.0;

    void apply(double wx, double wy, double& sx, double& sy) const;
    void invert(double sx, double sy, double& wx, double& wy) const;
    std::string to_string() const;
};

// Pan/zoom state of the content group. Every change is written to the
// group's transform attribute.
class Zoom {
public:
    explicit Zoom(svg_scene::Element& target);

    // Registers the wheel, pointer, touch and click listeners on the surface.
    void bind(svg_scene::Element& surface);

    const ZoomTransform& transform() const { return transform_; }
    svg_scene::Element& target() const { return target_; }

    void set_scale_extent(double min_scale, double max_scale);
    double min_scale() const { return min_scale_; }
    double max_scale() const { return max_scale_; }

    void zoom_at(double screen_x, double screen_y, double factor);
    void scale_to(double k, double center_x, double center_y);
    void translate_by(double dx, double dy);
    void set_transform(const ZoomTransform& transform);
    void reset();

    bool is_dragging() const { return dragging_; }

    static constexpr double wheel_factor = 1.2;
    static constexpr double click_distance = 3.0;
    static constexpr double min_scale_floor = 1e-6;

private:
    double clamp_scale(double k) const;
    void apply();

    svg_scene::Element& target_;
    ZoomTransform transform_;
    double min_scale_ = 0.1;
    double max_scale_ = 20.0;

    bool dragging_ = false;
    bool drag_moved_ = false;
    bool suppress_click_ = false;
    double drag_start_x_ = 0;
    double drag_start_y_ = 0;
    double last_x_ = 0;
    double last_y_ = 0;
};

} // namespace canvas
