#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace svg_scene {
class Element;
}

namespace canvas {

class UnsupportedExportFormat : public std::invalid_argument {
public:
    explicit UnsupportedExportFormat(const std::string& format)
        : std::invalid_argument("unsupported export format: " + format), format_(format) {}

    const std::string& format() const { return format_; }

private:
    std::string format_;
};

// Serializes the chart surface into one output format.
class Exporter {
public:
    virtual ~Exporter() = default;

    virtual std::string format() const = 0;
    virtual std::string mime_type() const = 0;

    // Empty result on failure; the reason is logged.
    virtual std::vector<std::uint8_t> render(const svg_scene::Element& svg,
        double width, double height) const = 0;

    bool save(const svg_scene::Element& svg, double width, double height, const std::string& path) const;
};

class SvgExport : public Exporter {
public:
    std::string format() const override { return "svg"; }
    std::string mime_type() const override { return "image/svg+xml"; }
    std::vector<std::uint8_t> render(const svg_scene::Element& svg,
        double width, double height) const override;

    // Standalone document: XML declaration, namespaces and a fixed size.
    static std::string to_document(const svg_scene::Element& svg, double width, double height);
};

class PngExport : public Exporter {
public:
    std::string format() const override { return "png"; }
    std::string mime_type() const override { return "image/png"; }
    std::vector<std::uint8_t> render(const svg_scene::Element& svg,
        double width, double height) const override;
};

class ExportFactory {
public:
    // Throws UnsupportedExportFormat for anything but "svg" and "png".
    std::unique_ptr<Exporter> create(const std::string& type) const;

    static std::vector<std::string> formats();
};

} // namespace canvas
