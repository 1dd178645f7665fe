#include <pedigree_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace pedigree_loaders {

namespace {

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

bool bool_or(const nlohmann::json& j, const char* key, bool fallback) {
    return j.contains(key) && j[key].is_boolean() ? j[key].get<bool>() : fallback;
}

pedigree_model::DateFacts parse_date(const nlohmann::json& j, const char* key) {
    pedigree_model::DateFacts date;
    if (!j.contains(key) || !j[key].is_object()) return date;
    const auto& d = j[key];
    date.display = string_or(d, "display");
    if (d.contains("year") && d["year"].is_number_integer()) {
        date.minimum_year = d["year"].get<int>();
        date.ok = bool_or(d, "ok", true);
    }
    return date;
}

std::optional<ChartEntry> parse_individual(const nlohmann::json& p) {
    if (!p.is_object()) return std::nullopt;
    if (!p.contains("xref") || !p["xref"].is_string()) return std::nullopt;

    ChartEntry entry;
    auto& ind = entry.individual;
    ind.xref = p["xref"].get<std::string>();
    ind.url = string_or(p, "url");
    ind.edit_url = string_or(p, "edit_url");
    ind.sex = pedigree_model::sex_from_code(string_or(p, "sex", "U"));
    ind.full_name = string_or(p, "full_name");
    ind.full_name_flat = string_or(p, "full_name_flat");
    if (p.contains("alternate_name") && p["alternate_name"].is_string())
        ind.alternate_name = p["alternate_name"].get<std::string>();
    ind.birth = parse_date(p, "birth");
    ind.death = parse_date(p, "death");
    ind.is_dead = bool_or(p, "is_dead", ind.death.ok);
    ind.can_show = bool_or(p, "can_show", true);
    if (p.contains("highlight_image") && p["highlight_image"].is_string())
        ind.highlight_media = pedigree_model::HighlightMedia{ p["highlight_image"].get<std::string>() };
    ind.color = string_or(p, "color");
    ind.x = p.contains("x") && p["x"].is_number() ? p["x"].get<double>() : 0;
    ind.y = p.contains("y") && p["y"].is_number() ? p["y"].get<double>() : 0;
    entry.generation = p.contains("generation") && p["generation"].is_number_integer()
        ? p["generation"].get<int>() : 0;
    if (entry.generation < 0) return std::nullopt;
    return entry;
}

std::optional<std::vector<ChartEntry>> parse_individuals_json(const nlohmann::json& j) {
    if (!j.contains("individuals") || !j["individuals"].is_array()) return std::nullopt;

    std::vector<ChartEntry> out;
    for (const auto& p : j["individuals"]) {
        auto entry = parse_individual(p);
        if (!entry) return std::nullopt;
        out.push_back(std::move(*entry));
    }
    return out;
}

} // namespace

std::optional<std::vector<ChartEntry>> load_individuals_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_individuals_json(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("load_individuals_from_json: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<ChartEntry>> load_individuals_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_individuals_from_json(f);
}

} // namespace pedigree_loaders
