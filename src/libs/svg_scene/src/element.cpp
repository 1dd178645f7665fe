#include <svg_scene/element.hpp>
#include <algorithm>
#include <cstdio>
#include <sstream>

namespace svg_scene {

std::string format_number(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    std::string s(buf);
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

Element::Element(std::string tag)
    : tag_(std::move(tag))
{
}

Element::~Element() = default;

Element& Element::attr(const std::string& name, const std::string& value) {
    for (auto& a : attributes_) {
        if (a.first == name) {
            a.second = value;
            return *this;
        }
    }
    attributes_.emplace_back(name, value);
    return *this;
}

Element& Element::attr(const std::string& name, double value) {
    return attr(name, format_number(value));
}

std::string Element::attr(const std::string& name) const {
    for (const auto& a : attributes_) {
        if (a.first == name) return a.second;
    }
    return {};
}

bool Element::has_attr(const std::string& name) const {
    return std::any_of(attributes_.begin(), attributes_.end(),
        [&](const auto& a) { return a.first == name; });
}

void Element::remove_attr(const std::string& name) {
    attributes_.erase(std::remove_if(attributes_.begin(), attributes_.end(),
        [&](const auto& a) { return a.first == name; }), attributes_.end());
}

Element& Element::classed(const std::string& name, bool enabled) {
    std::vector<std::string> classes;
    {
        std::istringstream in(attr("class"));
        std::string token;
        while (in >> token) {
            if (token != name) classes.push_back(token);
        }
    }
    if (enabled) classes.push_back(name);

    if (classes.empty()) {
        remove_attr("class");
        return *this;
    }
    std::string value;
    for (const auto& c : classes) {
        if (!value.empty()) value += ' ';
        value += c;
    }
    return attr("class", value);
}

bool Element::has_class(const std::string& name) const {
    std::istringstream in(attr("class"));
    std::string token;
    while (in >> token) {
        if (token == name) return true;
    }
    return false;
}

Element& Element::text(const std::string& value) {
    text_ = value;
    return *this;
}

Element& Element::append(const std::string& tag) {
    return append(std::make_unique<Element>(tag));
}

Element& Element::append(std::unique_ptr<Element> child) {
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

Element* Element::find_by_id(const std::string& id) {
    return const_cast<Element*>(static_cast<const Element*>(this)->find_by_id(id));
}

const Element* Element::find_by_id(const std::string& id) const {
    if (attr("id") == id) return this;
    for (const auto& child : children_) {
        if (const Element* found = child->find_by_id(id)) return found;
    }
    return nullptr;
}

std::vector<Element*> Element::select_all(const std::string& tag) {
    std::vector<Element*> out;
    for (const auto& child : children_) {
        if (child->tag_ == tag) out.push_back(child.get());
        auto nested = child->select_all(tag);
        out.insert(out.end(), nested.begin(), nested.end());
    }
    return out;
}

void Element::on(EventType type, EventListener listener, bool capture) {
    listeners_.push_back({ type, std::move(listener), capture });
}

std::size_t Element::listener_count(EventType type) const {
    return static_cast<std::size_t>(std::count_if(listeners_.begin(), listeners_.end(),
        [type](const Listener& l) { return l.type == type; }));
}

void Element::invoke(Event& event, bool capture_phase) {
    // Listeners may register further listeners while running.
    const std::vector<Listener> snapshot = listeners_;
    event.current_target = this;
    for (const auto& l : snapshot) {
        if (l.type != event.type || l.capture != capture_phase) continue;
        l.callback(event);
    }
}

void Element::dispatch(Element& target, Event& event) {
    event.target = &target;

    std::vector<Element*> path;
    for (Element* e = &target; e; e = e->parent_)
        path.push_back(e);

    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        (*it)->invoke(event, true);
        if (event.propagation_stopped()) return;
    }
    for (Element* e : path) {
        e->invoke(event, false);
        if (event.propagation_stopped()) return;
    }
    event.current_target = nullptr;
}

} // namespace svg_scene
