#include <canvas/zoom.hpp>
#include <svg_scene/element.hpp>
#include <algorithm>
#include <cmath>

namespace canvas {

void ZoomTransform::apply(double wx, double wy, double& sx, double& sy) const {
    sx = wx * k + x;
    sy = wy * k + y;
}

void ZoomTransform::invert(double sx, double sy, double& wx, double& wy) const {
    wx = (sx - x) / k;
    wy = (sy - y) / k;
}

std::string ZoomTransform::to_string() const {
    return "translate(" + svg_scene::format_number(x) + "," + svg_scene::format_number(y)
        + ") scale(" + svg_scene::format_number(k) + ")";
}

Zoom::Zoom(svg_scene::Element& target)
    : target_(target)
{
    apply();
}

void Zoom::bind(svg_scene::Element& surface) {
    using svg_scene::Event;
    using svg_scene::EventType;

    surface.on(EventType::Wheel, [this](Event& event) {
        // Plain scrolling belongs to the page.
        if (!event.ctrl_key || event.wheel_delta == 0) return;
        event.prevent_default();
        const double factor = std::pow(wheel_factor, event.wheel_delta > 0 ? 1.0 : -1.0);
        zoom_at(event.x, event.y, factor);
    });

    surface.on(EventType::PointerDown, [this](Event& event) {
        if (event.button != 0) return;
        dragging_ = true;
        drag_moved_ = false;
        drag_start_x_ = last_x_ = event.x;
        drag_start_y_ = last_y_ = event.y;
    });

    surface.on(EventType::PointerMove, [this](Event& event) {
        if (!dragging_) return;
        translate_by(event.x - last_x_, event.y - last_y_);
        last_x_ = event.x;
        last_y_ = event.y;
        if (std::hypot(event.x - drag_start_x_, event.y - drag_start_y_) > click_distance)
            drag_moved_ = true;
    });

    surface.on(EventType::PointerUp, [this](Event&) {
        if (!dragging_) return;
        dragging_ = false;
        suppress_click_ = drag_moved_;
    });

    surface.on(EventType::TouchMove, [this](Event& event) {
        if (event.touch_count < 2 || event.pinch_scale == 1.0) return;
        event.prevent_default();
        zoom_at(event.x, event.y, event.pinch_scale);
    });

    // The click that ends a drag must not reach the nodes.
    surface.on(EventType::Click, [this](Event& event) {
        if (!suppress_click_) return;
        suppress_click_ = false;
        event.prevent_default();
    }, true);
}

void Zoom::set_scale_extent(double min_scale, double max_scale) {
    // A zero scale makes the transform non-invertible.
    min_scale_ = std::max(min_scale_floor, std::min(min_scale, max_scale));
    max_scale_ = std::max(min_scale_, std::max(min_scale, max_scale));
    if (transform_.k != clamp_scale(transform_.k))
        scale_to(clamp_scale(transform_.k), 0, 0);
}

double Zoom::clamp_scale(double k) const {
    return std::clamp(k, min_scale_, max_scale_);
}

void Zoom::zoom_at(double screen_x, double screen_y, double factor) {
    if (factor <= 0) return;
    scale_to(transform_.k * factor, screen_x, screen_y);
}

void Zoom::scale_to(double k, double center_x, double center_y) {
    const double new_k = clamp_scale(k);
    const double f = new_k / transform_.k;
    transform_.x = center_x - (center_x - transform_.x) * f;
    transform_.y = center_y - (center_y - transform_.y) * f;
    transform_.k = new_k;
    apply();
}

void Zoom::translate_by(double dx, double dy) {
    transform_.x += dx;
    transform_.y += dy;
    apply();
}

void Zoom::set_transform(const ZoomTransform& transform) {
    transform_ = transform;
    transform_.k = clamp_scale(transform_.k);
    apply();
}

void Zoom::reset() {
    transform_ = ZoomTransform{};
    apply();
}

void Zoom::apply() {
    target_.attr("transform", transform_.to_string());
}

} // namespace canvas
