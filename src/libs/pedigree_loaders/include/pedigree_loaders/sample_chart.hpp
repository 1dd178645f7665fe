#pragma once

#include <pedigree_loaders/json_loader.hpp>
#include <vector>

namespace pedigree_loaders {

// Small built-in pedigree used when no individuals file is found.
std::vector<ChartEntry> generate_sample_chart();

} // namespace pedigree_loaders
