#include <display_records/record_builder.hpp>
#include <name_parts/name_decomposer.hpp>
#include <spdlog/spdlog.h>

namespace display_records {

namespace {

std::string format_year(const std::string& format, int year) {
    std::string out = format;
    const auto pos = out.find("%s");
    if (pos != std::string::npos)
        out.replace(pos, 2, std::to_string(year));
    return out;
}

} // namespace

RecordOptions record_options_from(const pedigree_model::Configuration& configuration) {
    RecordOptions options;
    options.thumbnail.asset_base_url = configuration.asset_base_url;
    options.thumbnail.show_highlight_images = configuration.show_highlight_images;
    return options;
}

std::string timespan_label(const pedigree_model::DateFacts& birth,
    const pedigree_model::DateFacts& death,
    bool is_dead,
    const TimespanLabels& labels)
{
    if (birth.ok && death.ok)
        return std::to_string(birth.minimum_year) + "-" + std::to_string(death.minimum_year);
    if (birth.ok)
        return format_year(labels.born, birth.minimum_year);
    if (death.ok)
        return format_year(labels.died, death.minimum_year);
    if (is_dead)
        return labels.deceased;
    return {};
}

std::string image_url(const std::string& base_url, int width, int height, const std::string& fit) {
    const char separator = base_url.find('?') == std::string::npos ? '?' : '&';
    return base_url + separator + "w=" + std::to_string(width) + "&h=" + std::to_string(height)
        + "&fit=" + fit;
}

std::string silhouette_url(const std::string& asset_base_url, pedigree_model::Sex sex) {
    return asset_base_url + "images/silhouette-" + pedigree_model::sex_code(sex) + ".svg";
}

std::string thumbnail_url(const pedigree_model::IndividualFacts& individual, const ThumbnailPolicy& policy) {
    if (individual.can_show && policy.show_highlight_images) {
        if (individual.highlight_media)
            return image_url(individual.highlight_media->image_url, policy.width, policy.height, policy.fit);
        return silhouette_url(policy.asset_base_url, individual.sex);
    }
    return silhouette_url(policy.asset_base_url, pedigree_model::Sex::Unknown);
}

pedigree_model::DisplayRecord build_display_record(const pedigree_model::IndividualFacts& individual,
    int generation,
    const RecordOptions& options)
{
    const name_parts::NameParts parts = name_parts::decompose(
        individual.full_name, individual.full_name_flat, individual.alternate_name);

    pedigree_model::DisplayRecord record;
    record.id = 0;
    record.xref = individual.xref;
    record.url = individual.url;
    record.edit_url = individual.edit_url;
    record.generation = generation < 0 ? 0 : generation;
    record.name = parts.display_name;
    record.first_names = parts.first_names;
    record.last_names = parts.last_names;
    record.preferred_name = parts.preferred_name;
    record.alternative_names = parts.alternative_names;
    record.is_alternative_rtl = parts.is_alternative_rtl;
    record.thumbnail = thumbnail_url(individual, options.thumbnail);
    record.sex = individual.sex;
    record.birth = name_parts::strip_tags(individual.birth.display);
    record.death = name_parts::strip_tags(individual.death.display);
    record.timespan = timespan_label(individual.birth, individual.death, individual.is_dead,
        options.timespan_labels);
    record.color = individual.color;
    record.colors = { {}, {} };

    if (generation < 0)
        spdlog::warn("build_display_record: negative generation {} for {} clamped to 0",
            generation, individual.xref);
    spdlog::debug("build_display_record: {} gen={} first={} last={}",
        record.xref, record.generation, record.first_names.size(), record.last_names.size());
    return record;
}

} // namespace display_records
