#include "gtest/gtest.h"
#include <canvas/zoom.hpp>
#include <svg_scene/element.hpp>
#include <cmath>

using svg_scene::Element;
using svg_scene::Event;
using svg_scene::EventType;

TEST(ZoomTest, WritesTransformAttribute) {
    Element g("g");
    canvas::Zoom zoom(g);
    EXPECT_EQ(g.attr("transform"), "translate(0,0) scale(1)");

    zoom.zoom_at(100, 100, 2.0);
    EXPECT_DOUBLE_EQ(zoom.transform().k, 2.0);
    EXPECT_DOUBLE_EQ(zoom.transform().x, -100.0);
    EXPECT_EQ(g.attr("transform"), "translate(-100,-100) scale(2)");

    double wx = 0, wy = 0;
    zoom.transform().invert(100, 100, wx, wy);
    EXPECT_DOUBLE_EQ(wx, 100.0);
    EXPECT_DOUBLE_EQ(wy, 100.0);

    zoom.reset();
    EXPECT_EQ(g.attr("transform"), "translate(0,0) scale(1)");
}

TEST(ZoomTest, ScaleIsClamped) {
    Element g("g");
    canvas::Zoom zoom(g);
    zoom.scale_to(100.0, 0, 0);
    EXPECT_DOUBLE_EQ(zoom.transform().k, 20.0);
    zoom.scale_to(0.001, 0, 0);
    EXPECT_DOUBLE_EQ(zoom.transform().k, 0.1);

    zoom.set_scale_extent(0.5, 4.0);
    EXPECT_DOUBLE_EQ(zoom.transform().k, 0.5);
    zoom.set_transform({ 10.0, 5.0, 5.0 });
    EXPECT_DOUBLE_EQ(zoom.transform().k, 4.0);
}

TEST(ZoomTest, CtrlWheelZooms) {
    Element svg("svg");
    auto& g = svg.append("g");
    canvas::Zoom zoom(g);
    zoom.bind(svg);

    Event plain(EventType::Wheel);
    plain.wheel_delta = 1;
    Element::dispatch(svg, plain);
    EXPECT_DOUBLE_EQ(zoom.transform().k, 1.0);
    EXPECT_FALSE(plain.default_prevented());

    Event in(EventType::Wheel);
    in.wheel_delta = 1;
    in.ctrl_key = true;
    Element::dispatch(svg, in);
    EXPECT_DOUBLE_EQ(zoom.transform().k, canvas::Zoom::wheel_factor);
    EXPECT_TRUE(in.default_prevented());

    Event out(EventType::Wheel);
    out.wheel_delta = -3;
    out.ctrl_key = true;
    Element::dispatch(svg, out);
    EXPECT_NEAR(zoom.transform().k, 1.0, 1e-9);
}

TEST(ZoomTest, DragPansAndSuppressesClick) {
    Element svg("svg");
    auto& g = svg.append("g");
    canvas::Zoom zoom(g);
    zoom.bind(svg);

    Event down(EventType::PointerDown);
    down.x = 10;
    down.y = 10;
    Element::dispatch(svg, down);
    EXPECT_TRUE(zoom.is_dragging());

    Event move(EventType::PointerMove);
    move.x = 30;
    move.y = 15;
    Element::dispatch(svg, move);
    EXPECT_DOUBLE_EQ(zoom.transform().x, 20.0);
    EXPECT_DOUBLE_EQ(zoom.transform().y, 5.0);

    Event up(EventType::PointerUp);
    Element::dispatch(svg, up);
    EXPECT_FALSE(zoom.is_dragging());

    Event click(EventType::Click);
    Element::dispatch(g, click);
    EXPECT_TRUE(click.default_prevented());

    // Only the click right after the drag is affected.
    Event next(EventType::Click);
    Element::dispatch(g, next);
    EXPECT_FALSE(next.default_prevented());
}

TEST(ZoomTest, ShortDragStillClicks) {
    Element svg("svg");
    auto& g = svg.append("g");
    canvas::Zoom zoom(g);
    zoom.bind(svg);

    Event down(EventType::PointerDown);
    Element::dispatch(svg, down);
    Event move(EventType::PointerMove);
    move.x = 2;
    Element::dispatch(svg, move);
    Event up(EventType::PointerUp);
    Element::dispatch(svg, up);

    Event click(EventType::Click);
    Element::dispatch(g, click);
    EXPECT_FALSE(click.default_prevented());
}

TEST(ZoomTest, PinchZooms) {
    Element svg("svg");
    auto& g = svg.append("g");
    canvas::Zoom zoom(g);
    zoom.bind(svg);

    Event pinch(EventType::TouchMove);
    pinch.touch_count = 2;
    pinch.pinch_scale = 1.5;
    Element::dispatch(svg, pinch);
    EXPECT_DOUBLE_EQ(zoom.transform().k, 1.5);

    Event single(EventType::TouchMove);
    single.touch_count = 1;
    single.pinch_scale = 2.0;
    Element::dispatch(svg, single);
    EXPECT_DOUBLE_EQ(zoom.transform().k, 1.5);
}

TEST(ZoomTest, ZeroMinimumScaleStaysInvertible) {
    Element g("g");
    canvas::Zoom zoom(g);
    zoom.set_scale_extent(0.0, 4.0);
    EXPECT_GT(zoom.min_scale(), 0.0);

    zoom.scale_to(0.0, 50, 50);
    EXPECT_GT(zoom.transform().k, 0.0);
    zoom.zoom_at(50, 50, 2.0);
    double wx = 0, wy = 0;
    zoom.transform().invert(10, 10, wx, wy);
    EXPECT_TRUE(std::isfinite(wx));
    EXPECT_TRUE(std::isfinite(wy));
}
