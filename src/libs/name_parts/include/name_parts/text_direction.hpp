#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace name_parts {

bool is_rtl_code_point(std::uint32_t cp);

// True if the first character with strong direction is right-to-left.
bool is_rtl(std::string_view utf8_text);
bool is_rtl(const std::vector<std::string>& words);

} // namespace name_parts
