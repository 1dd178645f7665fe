#pragma once

#include <memory>
#include <string>
#include <unordered_map>

namespace svg_scene {
class Element;
}

namespace canvas {

// Registry of reusable definitions (gradients, patterns, clip paths,
// markers) kept in the <defs> element and referenced by id.
class Defs {
public:
    explicit Defs(svg_scene::Element& svg);

    // Returns nullptr if the id is already taken. Entries are never removed.
    svg_scene::Element* add(const std::string& id, std::unique_ptr<svg_scene::Element> definition);

    svg_scene::Element* get(const std::string& id);
    const svg_scene::Element* get(const std::string& id) const;
    bool has(const std::string& id) const { return by_id_.count(id) != 0; }
    std::size_t size() const { return by_id_.size(); }

    svg_scene::Element& element() { return defs_; }
    const svg_scene::Element& element() const { return defs_; }

private:
    svg_scene::Element& defs_;
    std::unordered_map<std::string, svg_scene::Element*> by_id_;
};

} // namespace canvas
