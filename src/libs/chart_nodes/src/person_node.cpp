#include <chart_nodes/person_node.hpp>
#include <canvas/defs.hpp>
#include <svg_scene/element.hpp>
#include <memory>

namespace chart_nodes {

namespace {

const char* const clip_image_id = "clip-image";

struct FillColors {
    pedigree_model::Sex sex;
    const char* top;
    const char* bottom;
};

const FillColors fills[] = {
    { pedigree_model::Sex::Male, "#b3d4fc", "#6fa8dc" },
    { pedigree_model::Sex::Female, "#f9c5d1", "#e38fa5" },
    { pedigree_model::Sex::Unknown, "#e0e0e0", "#b0b0b0" },
};

std::unique_ptr<svg_scene::Element> make_gradient(const FillColors& colors) {
    auto gradient = std::make_unique<svg_scene::Element>("linearGradient");
    gradient->attr("x1", "0%").attr("y1", "0%").attr("x2", "0%").attr("y2", "100%");
    gradient->append("stop").attr("offset", "0%").attr("stop-color", colors.top);
    gradient->append("stop").attr("offset", "100%").attr("stop-color", colors.bottom);
    return gradient;
}

std::string join(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += w;
    }
    return out;
}

void append_names(svg_scene::Element& text, const pedigree_model::DisplayRecord& record) {
    bool first = true;
    for (const auto& name : record.first_names) {
        auto& span = text.append("tspan").text((first ? "" : " ") + name);
        if (name == record.preferred_name) span.classed("preferred", true);
        first = false;
    }
    for (const auto& name : record.last_names) {
        text.append("tspan").classed("lastName", true).text((first ? "" : " ") + name);
        first = false;
    }
    // Markup without name parts still shows the flat name.
    if (first) text.text(record.name);
}

} // namespace

std::string fill_id(pedigree_model::Sex sex) {
    return std::string("person-fill-") + pedigree_model::sex_code(sex);
}

void register_definitions(canvas::Defs& defs) {
    if (!defs.has(clip_image_id)) {
        auto clip = std::make_unique<svg_scene::Element>("clipPath");
        clip->append("circle").attr("r", box::image_radius);
        defs.add(clip_image_id, std::move(clip));
    }
    for (const auto& colors : fills) {
        const std::string id = fill_id(colors.sex);
        if (!defs.has(id)) defs.add(id, make_gradient(colors));
    }
}

svg_scene::Element& append_person(svg_scene::Element& group,
    canvas::Defs& defs,
    const pedigree_model::DisplayRecord& record,
    double x, double y,
    const pedigree_model::Configuration& configuration,
    PersonClickHandler on_click)
{
    register_definitions(defs);

    const bool rtl = configuration.rtl();
    const double half_w = box::width / 2;
    const double half_h = box::height / 2;
    const double image_cx = (rtl ? half_w : -half_w) + (rtl ? -1 : 1) * (box::image_radius + box::image_padding);
    const double text_x = rtl ? -box::image_radius : box::image_radius;

    auto& person = group.append("g");
    person.classed("person", true)
        .attr("data-xref", record.xref)
        .attr("data-generation", record.generation)
        .attr("transform", "translate(" + svg_scene::format_number(x) + "," + svg_scene::format_number(y) + ")");

    person.append("title").text(record.name);

    person.append("rect")
        .classed("background", true)
        .attr("x", -half_w).attr("y", -half_h)
        .attr("width", box::width).attr("height", box::height)
        .attr("rx", box::corner_radius).attr("ry", box::corner_radius)
        .attr("fill", record.color.empty() ? "url(#" + fill_id(record.sex) + ")" : record.color);

    auto& image = person.append("g").classed("image", true)
        .attr("transform", "translate(" + svg_scene::format_number(image_cx) + ",0)");
    image.append("image")
        .attr("xlink:href", record.thumbnail)
        .attr("x", -box::image_radius).attr("y", -box::image_radius)
        .attr("width", box::image_radius * 2).attr("height", box::image_radius * 2)
        .attr("clip-path", std::string("url(#") + clip_image_id + ")");

    auto& name = person.append("text").classed("name", true)
        .attr("x", text_x).attr("y", -12);
    append_names(name, record);

    if (!record.alternative_names.empty()) {
        auto& alt = person.append("text").classed("alternativeName", true)
            .attr("x", text_x).attr("y", 8)
            .text(join(record.alternative_names));
        if (record.is_alternative_rtl) alt.attr("direction", "rtl");
    }

    if (!record.timespan.empty()) {
        person.append("text").classed("date", true)
            .attr("x", text_x).attr("y", 28)
            .text(record.timespan);
    }

    if (on_click) {
        const pedigree_model::DisplayRecord copy = record;
        person.on(svg_scene::EventType::Click, [copy, on_click](svg_scene::Event&) { on_click(copy); });
    }
    return person;
}

} // namespace chart_nodes
