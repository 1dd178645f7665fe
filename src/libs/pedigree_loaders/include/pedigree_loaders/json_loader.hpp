#pragma once

#include <pedigree_model/configuration.hpp>
#include <pedigree_model/individual.hpp>
#include <optional>
#include <istream>
#include <string>
#include <vector>

namespace pedigree_loaders {

struct ChartEntry {
    pedigree_model::IndividualFacts individual;
    int generation = 0;
};

std::optional<std::vector<ChartEntry>> load_individuals_from_json(std::istream& in);
std::optional<std::vector<ChartEntry>> load_individuals_from_json_file(const std::string& path);

// Missing keys keep their defaults; malformed JSON yields std::nullopt.
std::optional<pedigree_model::Configuration> load_configuration_from_json(std::istream& in);
std::optional<pedigree_model::Configuration> load_configuration_from_json_file(const std::string& path);

} // namespace pedigree_loaders
