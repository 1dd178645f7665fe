#include <canvas/defs.hpp>
#include <canvas/log.hpp>
#include <svg_scene/element.hpp>
#include <spdlog/spdlog.h>

namespace canvas {

Defs::Defs(svg_scene::Element& svg)
    : defs_(svg.append("defs"))
{
}

svg_scene::Element* Defs::add(const std::string& id, std::unique_ptr<svg_scene::Element> definition) {
    if (!definition || id.empty()) return nullptr;
    if (has(id)) {
        chart_logger()->warn("defs_duplicate id={} tag={}", id, definition->tag());
        return nullptr;
    }
    definition->attr("id", id);
    svg_scene::Element& added = defs_.append(std::move(definition));
    by_id_.emplace(id, &added);
    return &added;
}

svg_scene::Element* Defs::get(const std::string& id) {
    auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : it->second;
}

const svg_scene::Element* Defs::get(const std::string& id) const {
    auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : it->second;
}

} // namespace canvas
