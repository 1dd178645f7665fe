#include <name_parts/text_direction.hpp>

namespace name_parts {

namespace {

struct Range {
    std::uint32_t first;
    std::uint32_t last;
};

const Range rtl_ranges[] = {
    { 0x0590, 0x05FF },   // Hebrew
    { 0x0600, 0x06FF },   // Arabic
    { 0x0700, 0x074F },   // Syriac
    { 0x0750, 0x077F },   // Arabic Supplement
    { 0x0780, 0x07BF },   // Thaana
    { 0x07C0, 0x07FF },   // N'Ko
    { 0x0800, 0x083F },   // Samaritan
    { 0x0840, 0x085F },   // Mandaic
    { 0x0860, 0x086F },   // Syriac Supplement
    { 0x0870, 0x08FF },   // Arabic Extended-B/A
    { 0xFB1D, 0xFB4F },   // Hebrew presentation forms
    { 0xFB50, 0xFDFF },   // Arabic Presentation Forms-A
    { 0xFE70, 0xFEFF },   // Arabic Presentation Forms-B
    { 0x10800, 0x10FFF }, // Cypriot .. Old Uyghur
    { 0x1E800, 0x1EFFF }, // Mende Kikakui .. Arabic Mathematical
};

// Characters without strong direction: digits, punctuation, symbols, marks.
bool is_neutral(std::uint32_t cp) {
    if (cp < 0x80) {
        return !((cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z'));
    }
    // Feminine/masculine ordinal and micro sign are strong left-to-right.
    if (cp == 0x00AA || cp == 0x00B5 || cp == 0x00BA) return false;
    if (cp >= 0x0080 && cp <= 0x00BF) return true;
    if (cp == 0x00D7 || cp == 0x00F7) return true;
    if (cp >= 0x0300 && cp <= 0x036F) return true;  // combining diacritics
    if (cp >= 0x0660 && cp <= 0x0669) return true;  // Arabic-Indic digits
    if (cp >= 0x06F0 && cp <= 0x06F9) return true;
    if (cp >= 0x2000 && cp <= 0x206F) return true;  // general punctuation
    if (cp >= 0x3000 && cp <= 0x303F) return true;
    return false;
}

// Decodes one code point; invalid sequences consume a single byte.
std::uint32_t next_code_point(std::string_view text, std::size_t& pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    int extra = 0;
    std::uint32_t cp = 0;
    if (lead < 0x80) { cp = lead; }
    else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; extra = 1; }
    else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; extra = 2; }
    else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; extra = 3; }
    else { ++pos; return 0xFFFD; }

    if (extra == 0) {
        ++pos;
        return cp;
    }

    if (pos + extra >= text.size()) {
        pos = text.size();
        return 0xFFFD;
    }
    for (int i = 1; i <= extra; ++i) {
        const auto c = static_cast<unsigned char>(text[pos + i]);
        if ((c & 0xC0) != 0x80) {
            ++pos;
            return 0xFFFD;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    pos += extra + 1;
    return cp;
}

// 1 for right-to-left, 0 for left-to-right, -1 if no strong character.
int strong_direction(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::uint32_t cp = next_code_point(text, pos);
        if (cp == 0xFFFD || is_neutral(cp)) continue;
        return is_rtl_code_point(cp) ? 1 : 0;
    }
    return -1;
}

} // namespace

bool is_rtl_code_point(std::uint32_t cp) {
    for (const auto& r : rtl_ranges) {
        if (cp >= r.first && cp <= r.last) return true;
    }
    return false;
}

bool is_rtl(std::string_view utf8_text) {
    return strong_direction(utf8_text) == 1;
}

bool is_rtl(const std::vector<std::string>& words) {
    for (const auto& word : words) {
        const int direction = strong_direction(word);
        if (direction >= 0) return direction == 1;
    }
    return false;
}

} // namespace name_parts
