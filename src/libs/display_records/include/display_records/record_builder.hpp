#pragma once

#include <pedigree_model/configuration.hpp>
#include <pedigree_model/display_record.hpp>
#include <pedigree_model/individual.hpp>
#include <string>

namespace display_records {

// Label formats for the lifetime description; "%s" is replaced by the year.
struct TimespanLabels {
    std::string born = "Born: %s";
    std::string died = "Died: %s";
    std::string deceased = "Deceased";
};

struct ThumbnailPolicy {
    std::string asset_base_url;
    bool show_highlight_images = true;
    int width = 250;
    int height = 250;
    std::string fit = "contain";
};

struct RecordOptions {
    TimespanLabels timespan_labels;
    ThumbnailPolicy thumbnail;
};

RecordOptions record_options_from(const pedigree_model::Configuration& configuration);

std::string timespan_label(const pedigree_model::DateFacts& birth,
    const pedigree_model::DateFacts& death,
    bool is_dead,
    const TimespanLabels& labels = {});

// Sized image URL of a media file: appends w, h and fit query parameters.
std::string image_url(const std::string& base_url, int width, int height, const std::string& fit);

std::string silhouette_url(const std::string& asset_base_url, pedigree_model::Sex sex);

// Sex specific silhouettes only appear once visibility and the tree
// preference allow images at all; otherwise the generic one is used.
std::string thumbnail_url(const pedigree_model::IndividualFacts& individual, const ThumbnailPolicy& policy);

pedigree_model::DisplayRecord build_display_record(const pedigree_model::IndividualFacts& individual,
    int generation,
    const RecordOptions& options = {});

} // namespace display_records
