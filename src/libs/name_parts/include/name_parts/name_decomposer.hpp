#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace name_parts {

struct NameParts {
    std::vector<std::string> first_names;
    std::vector<std::string> last_names;
    std::string preferred_name;
    std::vector<std::string> alternative_names;
    bool is_alternative_rtl = false;
    std::string display_name;
};

// Raised only when the parser produced no tree at all for a fragment.
class MarkupParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Splits a formatted full name into its parts. Expected markup convention:
//   <span class="NAME">John <span class="starredname">Paul</span>
//       <q class="wt-nickname">Jack</q> van <span class="SURN">Berg</span></span>
// The queries run in a fixed order: preferred name, last names, first names,
// alternate name. Missing parts yield empty fields, never an error.
NameParts decompose(const std::string& full_name_markup,
    const std::string& full_name_flat,
    const std::optional<std::string>& alternate_name_markup);

// Single queries, each on a freshly parsed tree. These throw MarkupParseError
// where decompose() degrades to empty fields.
std::string preferred_name(const std::string& full_name_markup);
std::vector<std::string> last_names(const std::string& full_name_markup);
std::vector<std::string> first_names(const std::string& full_name_markup);

// Text of the first element whose class contains "NAME", or of the whole
// fragment, split on whitespace. Throws MarkupParseError if nothing parsed.
std::vector<std::string> alternate_names(const std::string& alternate_name_markup);

// Removes the "@N.N." / "@P.N." placeholders and normalizes spacing.
std::string remove_name_placeholders(const std::string& full_name_flat);

// Text content of a markup fragment.
std::string strip_tags(const std::string& markup);

std::vector<std::string> split_words(const std::string& text);

} // namespace name_parts
