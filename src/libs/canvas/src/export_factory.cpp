#include <canvas/export.hpp>
#include <canvas/log.hpp>
#include <svg_scene/element.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace canvas {

bool Exporter::save(const svg_scene::Element& svg, double width, double height, const std::string& path) const {
    const std::vector<std::uint8_t> bytes = render(svg, width, height);
    if (bytes.empty()) {
        chart_logger()->error("export_failed format={} path={}", format(), path);
        return false;
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        chart_logger()->error("export_open_failed format={} path={}", format(), path);
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        chart_logger()->error("export_write_failed format={} path={}", format(), path);
        return false;
    }
    chart_logger()->info("export_saved format={} path={} bytes={}", format(), path, bytes.size());
    return true;
}

std::unique_ptr<Exporter> ExportFactory::create(const std::string& type) const {
    std::string key = type;
    std::transform(key.begin(), key.end(), key.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "png") return std::make_unique<PngExport>();
    if (key == "svg") return std::make_unique<SvgExport>();

    throw UnsupportedExportFormat(type);
}

std::vector<std::string> ExportFactory::formats() {
    return { "png", "svg" };
}

} // namespace canvas
