#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pedigree_model {

enum class Sex { Male, Female, Unknown };

// Render-ready description of one person node in the chart.
struct DisplayRecord {
    int id = 0;                 // assigned by the caller, always 0 when built
    std::string xref;
    std::string url;
    std::string edit_url;
    int generation = 0;
    std::string name;           // flat full name, placeholders removed
    std::vector<std::string> first_names;
    std::vector<std::string> last_names;
    std::string preferred_name;
    std::vector<std::string> alternative_names;
    bool is_alternative_rtl = false;
    std::string thumbnail;
    Sex sex = Sex::Unknown;
    std::string birth;
    std::string death;
    std::string timespan;
    std::string color;
    std::pair<std::vector<std::string>, std::vector<std::string>> colors;
};

inline const char* sex_code(Sex sex) {
    switch (sex) {
    case Sex::Male: return "M";
    case Sex::Female: return "F";
    case Sex::Unknown: break;
    }
    return "U";
}

inline Sex sex_from_code(const std::string& code) {
    if (code == "M" || code == "m" || code == "male") return Sex::Male;
    if (code == "F" || code == "f" || code == "female") return Sex::Female;
    return Sex::Unknown;
}

} // namespace pedigree_model
