#pragma once

#include <canvas/defs.hpp>
#include <canvas/export.hpp>
#include <canvas/zoom.hpp>
#include <pedigree_model/configuration.hpp>
#include <memory>
#include <string>

namespace svg_scene {
class Element;
}

namespace canvas {

class Overlay;

// Owns the <svg> surface of one chart: the definitions registry, the content
// group all nodes are drawn into and the pan/zoom engine attached to it.
class CanvasController {
public:
    enum class State { Uninitialized, Initialized, InteractionReady };

    CanvasController(svg_scene::Element& container, const pedigree_model::Configuration& configuration);
    ~CanvasController();

    CanvasController(const CanvasController&) = delete;
    CanvasController& operator=(const CanvasController&) = delete;

    // Sizes the surface to its container and sets the text rendering attributes.
    void initialize();

    // Wires the hint overlay to wheel and touch input, creates the content
    // group and binds the zoom engine. Throws std::logic_error before
    // initialize(). Calling it twice creates a second group; do not.
    // The overlay must outlive the controller.
    void initialize_interaction(Overlay& overlay);

    // Fresh exporter for "svg" or "png"; UnsupportedExportFormat otherwise.
    std::unique_ptr<Exporter> export_as(const std::string& type) const;

    Defs& defs() { return defs_; }
    const Defs& defs() const { return defs_; }
    Zoom* zoom() { return zoom_.get(); }
    const Zoom* zoom() const { return zoom_.get(); }
    svg_scene::Element* visual() { return visual_; }
    const svg_scene::Element* visual() const { return visual_; }
    svg_scene::Element& element() { return element_; }
    const svg_scene::Element& element() const { return element_; }

    State state() const { return state_; }
    const pedigree_model::Configuration& configuration() const { return configuration_; }

    // Overlay timings in milliseconds.
    static constexpr int zoom_hint_duration = 300;
    static constexpr int zoom_hint_hide_delay = 700;
    static constexpr int hint_hide_duration = 800;

private:
    svg_scene::Element& element_;
    Defs defs_;
    svg_scene::Element* visual_ = nullptr;
    std::unique_ptr<Zoom> zoom_;
    const pedigree_model::Configuration& configuration_;
    State state_ = State::Uninitialized;
};

const char* to_string(CanvasController::State state);

} // namespace canvas
