#include <canvas/export.hpp>
#include <svg_scene/element.hpp>
#include <sstream>

namespace canvas {

namespace {

std::string escape(const std::string& s, bool attribute) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"':
            if (attribute) out += "&quot;";
            else out += c;
            break;
        default:
            // Other C0 controls are not allowed in XML 1.0.
            if (static_cast<unsigned char>(c) >= 0x20 || c == '\t' || c == '\n' || c == '\r') out += c;
        }
    }
    return out;
}

void write_attributes(std::ostream& out, const svg_scene::Element& element) {
    for (const auto& [name, value] : element.attributes())
        out << ' ' << name << "=\"" << escape(value, true) << '"';
}

void write_element(std::ostream& out, const svg_scene::Element& element) {
    out << '<' << element.tag();
    write_attributes(out, element);
    if (element.text().empty() && element.children().empty()) {
        out << "/>";
        return;
    }
    out << '>' << escape(element.text(), false);
    for (const auto& child : element.children())
        write_element(out, *child);
    out << "</" << element.tag() << '>';
}

} // namespace

std::string SvgExport::to_document(const svg_scene::Element& svg, double width, double height) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>\n";
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" xmlns:xlink=\"http://www.w3.org/1999/xlink\"";
    out << " width=\"" << svg_scene::format_number(width) << "\"";
    out << " height=\"" << svg_scene::format_number(height) << "\"";
    if (!svg.has_attr("viewBox")) {
        out << " viewBox=\"0 0 " << svg_scene::format_number(width) << ' '
            << svg_scene::format_number(height) << "\"";
    }
    for (const auto& [name, value] : svg.attributes()) {
        // Relative sizes only make sense inside the hosting page.
        if (name == "width" || name == "height" || name == "xmlns" || name == "xmlns:xlink") continue;
        out << ' ' << name << "=\"" << escape(value, true) << '"';
    }
    out << '>' << escape(svg.text(), false);
    for (const auto& child : svg.children())
        write_element(out, *child);
    out << "</svg>\n";
    return out.str();
}

std::vector<std::uint8_t> SvgExport::render(const svg_scene::Element& svg, double width, double height) const {
    const std::string document = to_document(svg, width, height);
    return std::vector<std::uint8_t>(document.begin(), document.end());
}

} // namespace canvas
