#include <pedigree_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace pedigree_loaders {

namespace {

pedigree_model::Layout layout_from_string(const std::string& s) {
    if (s == "right-left") return pedigree_model::Layout::RightLeft;
    if (s == "top-bottom") return pedigree_model::Layout::TopBottom;
    if (s == "bottom-top") return pedigree_model::Layout::BottomTop;
    return pedigree_model::Layout::LeftRight;
}

std::optional<pedigree_model::Configuration> parse_configuration_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    pedigree_model::Configuration c;
    if (j.contains("direction") && j["direction"].is_string())
        c.direction = j["direction"].get<std::string>() == "rtl"
            ? pedigree_model::TextDirection::Rtl : pedigree_model::TextDirection::Ltr;
    // Older exports carry a plain boolean.
    if (j.contains("rtl") && j["rtl"].is_boolean() && j["rtl"].get<bool>())
        c.direction = pedigree_model::TextDirection::Rtl;

    if (j.contains("labels") && j["labels"].is_object()) {
        const auto& l = j["labels"];
        if (l.contains("zoom") && l["zoom"].is_string()) c.labels.zoom = l["zoom"].get<std::string>();
        if (l.contains("move") && l["move"].is_string()) c.labels.move = l["move"].get<std::string>();
    }
    if (j.contains("layout") && j["layout"].is_string())
        c.layout = layout_from_string(j["layout"].get<std::string>());
    if (j.contains("generations") && j["generations"].is_number_integer()) {
        const int generations = j["generations"].get<int>();
        if (generations < 1) return std::nullopt;
        c.generations = generations;
    }
    if (j.contains("asset_base_url") && j["asset_base_url"].is_string())
        c.asset_base_url = j["asset_base_url"].get<std::string>();
    if (j.contains("show_highlight_images") && j["show_highlight_images"].is_boolean())
        c.show_highlight_images = j["show_highlight_images"].get<bool>();
    if (j.contains("export_width") && j["export_width"].is_number()) c.export_width = j["export_width"].get<double>();
    if (j.contains("export_height") && j["export_height"].is_number()) c.export_height = j["export_height"].get<double>();

    return c;
}

} // namespace

std::optional<pedigree_model::Configuration> load_configuration_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_configuration_json(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("load_configuration_from_json: {}", e.what());
        return std::nullopt;
    }
}

std::optional<pedigree_model::Configuration> load_configuration_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_configuration_from_json(f);
}

} // namespace pedigree_loaders
