#pragma once

#include <functional>

namespace svg_scene {

class Element;

enum class EventType {
    ContextMenu,
    Wheel,
    TouchStart,
    TouchMove,
    TouchEnd,
    PointerDown,
    PointerMove,
    PointerUp,
    Click,
};

// Input event as delivered by the host platform. Coordinates are surface
// (screen) space relative to the root element.
struct Event {
    explicit Event(EventType t) : type(t) {}

    EventType type;
    double x = 0;
    double y = 0;
    double wheel_delta = 0;     // positive scrolls up / zooms in
    bool ctrl_key = false;
    int button = 0;
    int touch_count = 0;        // active touch points
    double pinch_scale = 1.0;   // relative scale since the last touch move

    Element* target = nullptr;
    Element* current_target = nullptr;

    void prevent_default() { default_prevented_ = true; }
    bool default_prevented() const { return default_prevented_; }
    void stop_propagation() { propagation_stopped_ = true; }
    bool propagation_stopped() const { return propagation_stopped_; }

private:
    bool default_prevented_ = false;
    bool propagation_stopped_ = false;
};

using EventListener = std::function<void(Event&)>;

} // namespace svg_scene
