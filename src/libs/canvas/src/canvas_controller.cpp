#include <canvas/canvas_controller.hpp>
#include <canvas/log.hpp>
#include <canvas/overlay.hpp>
#include <svg_scene/element.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace canvas {

const char* to_string(CanvasController::State state) {
    switch (state) {
    case CanvasController::State::Uninitialized: return "uninitialized";
    case CanvasController::State::Initialized: return "initialized";
    case CanvasController::State::InteractionReady: return "interaction_ready";
    }
    return "unknown";
}

CanvasController::CanvasController(svg_scene::Element& container,
    const pedigree_model::Configuration& configuration)
    : element_(container.append("svg"))
    , defs_(element_)
    , configuration_(configuration)
{
}

CanvasController::~CanvasController() = default;

void CanvasController::initialize() {
    element_
        .attr("width", "100%")
        .attr("height", "100%")
        .attr("text-rendering", "geometricPrecision")
        .attr("text-anchor", "middle");
    state_ = State::Initialized;
}

void CanvasController::initialize_interaction(Overlay& overlay) {
    using svg_scene::Event;
    using svg_scene::EventType;

    if (state_ == State::Uninitialized) {
        throw std::logic_error("CanvasController::initialize_interaction called before initialize");
    }

    // The zoom engine binds first so its drag-end click suppression has
    // already run when the click listener below inspects the event.
    visual_ = &element_.append("g");
    zoom_ = std::make_unique<Zoom>(*visual_);
    zoom_->bind(element_);

    const pedigree_model::Configuration& config = configuration_;
    Overlay* hint = &overlay;

    element_.on(EventType::ContextMenu, [](Event& event) { event.prevent_default(); });

    element_.on(EventType::Wheel, [hint, &config](Event& event) {
        if (event.ctrl_key) return;
        hint->show(config.labels.zoom, zoom_hint_duration, [hint] {
            hint->hide(zoom_hint_hide_delay, hint_hide_duration);
        });
    });

    element_.on(EventType::TouchEnd, [hint](Event& event) {
        if (event.touch_count < 2) hint->hide(0, hint_hide_duration);
    });

    element_.on(EventType::TouchMove, [hint, &config](Event& event) {
        if (event.touch_count >= 2) {
            // Pinch zoom in progress
            hint->hide();
        } else {
            hint->show(config.labels.move);
        }
    });

    element_.on(EventType::Click, [](Event& event) {
        if (event.default_prevented()) event.stop_propagation();
    }, true);

    if (configuration_.rtl()) {
        element_.classed("rtl", true);
    }

    state_ = State::InteractionReady;
    chart_logger()->info("canvas_interaction_ready rtl={} generations={}",
        configuration_.rtl(), configuration_.generations);
}

std::unique_ptr<Exporter> CanvasController::export_as(const std::string& type) const {
    if (state_ == State::Uninitialized) {
        throw std::logic_error("CanvasController::export_as called before initialize");
    }
    ExportFactory factory;
    return factory.create(type);
}

} // namespace canvas
