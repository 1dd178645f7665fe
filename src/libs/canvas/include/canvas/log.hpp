#pragma once

#include <memory>

namespace spdlog {
class logger;
}

namespace canvas {

// Chart logger writing to logs/pedigree_chart_latest.log below the project
// root; falls back to the default logger if the file cannot be opened.
std::shared_ptr<spdlog::logger> chart_logger();

} // namespace canvas
