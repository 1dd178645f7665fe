#pragma once

#include <svg_scene/event.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace svg_scene {

// Node of the SVG scene graph. Owns its children; attributes keep their
// insertion order so serialization is deterministic.
class Element {
public:
    explicit Element(std::string tag);
    ~Element();

    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    const std::string& tag() const { return tag_; }

    Element& attr(const std::string& name, const std::string& value);
    Element& attr(const std::string& name, double value);
    std::string attr(const std::string& name) const;
    bool has_attr(const std::string& name) const;
    void remove_attr(const std::string& name);
    const std::vector<std::pair<std::string, std::string>>& attributes() const { return attributes_; }

    Element& classed(const std::string& name, bool enabled);
    bool has_class(const std::string& name) const;

    Element& text(const std::string& value);
    const std::string& text() const { return text_; }

    Element& append(const std::string& tag);
    Element& append(std::unique_ptr<Element> child);
    const std::vector<std::unique_ptr<Element>>& children() const { return children_; }
    std::size_t child_count() const { return children_.size(); }
    Element* parent() const { return parent_; }

    Element* find_by_id(const std::string& id);
    const Element* find_by_id(const std::string& id) const;
    std::vector<Element*> select_all(const std::string& tag);

    void on(EventType type, EventListener listener, bool capture = false);
    std::size_t listener_count(EventType type) const;

    // Capture phase from the root down to the target, then the target and
    // bubble phase back up. Stops once a listener stops propagation.
    static void dispatch(Element& target, Event& event);

private:
    struct Listener {
        EventType type;
        EventListener callback;
        bool capture;
    };

    void invoke(Event& event, bool capture_phase);

    std::string tag_;
    std::vector<std::pair<std::string, std::string>> attributes_;
    std::string text_;
    std::vector<std::unique_ptr<Element>> children_;
    Element* parent_ = nullptr;
    std::vector<Listener> listeners_;
};

std::string format_number(double value);

} // namespace svg_scene
