#pragma once

#include <pedigree_model/display_record.hpp>
#include <optional>
#include <string>

namespace pedigree_model {

struct DateFacts {
    bool ok = false;            // date is resolvable to at least a year
    int minimum_year = 0;       // earliest year the date can denote
    std::string display;        // formatted date, may contain markup
};

struct HighlightMedia {
    std::string image_url;      // unsized image URL of the highlighted media file
};

// Facts about one individual as delivered by the genealogy data source.
struct IndividualFacts {
    std::string xref;
    std::string url;
    std::string edit_url;
    Sex sex = Sex::Unknown;
    std::string full_name;      // formatted primary name (markup)
    std::string full_name_flat; // primary name without markup, may hold @N.N. / @P.N.
    std::optional<std::string> alternate_name;
    DateFacts birth;
    DateFacts death;
    bool is_dead = false;
    bool can_show = true;
    std::optional<HighlightMedia> highlight_media;
    std::string color;

    // Chart position computed upstream by the tree layout.
    double x = 0;
    double y = 0;
};

} // namespace pedigree_model
