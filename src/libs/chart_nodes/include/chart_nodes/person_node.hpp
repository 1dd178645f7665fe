#pragma once

#include <pedigree_model/configuration.hpp>
#include <pedigree_model/display_record.hpp>
#include <functional>
#include <string>

namespace svg_scene {
class Element;
}
namespace canvas {
class Defs;
}

namespace chart_nodes {

namespace box {
constexpr double width = 260;
constexpr double height = 80;
constexpr double corner_radius = 20;
constexpr double image_radius = 35;
constexpr double image_padding = 5;
} // namespace box

using PersonClickHandler = std::function<void(const pedigree_model::DisplayRecord&)>;

// Registers the shared clip path and fills once; later calls are no-ops.
void register_definitions(canvas::Defs& defs);

std::string fill_id(pedigree_model::Sex sex);

// Appends <g class="person"> centered on (x, y) to the content group.
svg_scene::Element& append_person(svg_scene::Element& group,
    canvas::Defs& defs,
    const pedigree_model::DisplayRecord& record,
    double x, double y,
    const pedigree_model::Configuration& configuration,
    PersonClickHandler on_click = {});

} // namespace chart_nodes
