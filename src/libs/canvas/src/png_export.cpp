#include <canvas/export.hpp>
#include <canvas/log.hpp>
#include <svg_scene/element.hpp>
#include <spdlog/spdlog.h>
#include <thorvg_capi.h>
#include <png.h>
#include <cmath>
#include <csetjmp>

namespace canvas {

namespace {

const std::uint32_t max_dimension = 16384;

class TvgEngine {
public:
    TvgEngine() : ok_(tvg_engine_init(TVG_ENGINE_SW, 0) == TVG_RESULT_SUCCESS) {}
    ~TvgEngine() {
        if (ok_) tvg_engine_term(TVG_ENGINE_SW);
    }
    TvgEngine(const TvgEngine&) = delete;
    TvgEngine& operator=(const TvgEngine&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_;
};

struct TvgCanvasDeleter {
    void operator()(Tvg_Canvas* canvas) const { tvg_canvas_destroy(canvas); }
};

void png_write_to_vector(png_structp png_ptr, png_bytep data, png_size_t length) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png_ptr));
    out->insert(out->end(), data, data + length);
}

void png_flush_noop(png_structp) {}

// Pixels are ABGR8888 words, i.e. R, G, B, A bytes on little endian hosts.
std::vector<std::uint8_t> encode_png(const std::vector<std::uint32_t>& pixels,
    std::uint32_t width, std::uint32_t height)
{
    std::vector<std::uint8_t> out;

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) {
        chart_logger()->error("png_export: failed to create PNG write struct");
        return {};
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        chart_logger()->error("png_export: failed to create PNG info struct");
        png_destroy_write_struct(&png_ptr, nullptr);
        return {};
    }

    std::vector<png_bytep> row_pointers(height);
    for (std::uint32_t y = 0; y < height; ++y) {
        row_pointers[y] = reinterpret_cast<png_bytep>(
            const_cast<std::uint32_t*>(pixels.data() + static_cast<std::size_t>(y) * width));
    }

    if (setjmp(png_jmpbuf(png_ptr))) {
        chart_logger()->error("png_export: error during PNG creation");
        png_destroy_write_struct(&png_ptr, &info_ptr);
        return {};
    }

    png_set_write_fn(png_ptr, &out, png_write_to_vector, png_flush_noop);
    png_set_IHDR(png_ptr, info_ptr, width, height,
        8, PNG_COLOR_TYPE_RGBA, PNG_INTERLACE_NONE,
        PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png_ptr, info_ptr);
    png_write_image(png_ptr, row_pointers.data());
    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);
    return out;
}

} // namespace

std::vector<std::uint8_t> PngExport::render(const svg_scene::Element& svg, double width, double height) const {
    if (!(width >= 1 && height >= 1) || width > max_dimension || height > max_dimension) {
        chart_logger()->error("png_export: invalid size {}x{}", width, height);
        return {};
    }
    const auto w = static_cast<std::uint32_t>(std::lround(width));
    const auto h = static_cast<std::uint32_t>(std::lround(height));
    const std::string document = SvgExport::to_document(svg, width, height);

    TvgEngine engine;
    if (!engine.ok()) {
        chart_logger()->error("png_export: ThorVG software engine unavailable");
        return {};
    }

    std::unique_ptr<Tvg_Canvas, TvgCanvasDeleter> canvas(tvg_swcanvas_create());
    if (!canvas) {
        chart_logger()->error("png_export: failed to create canvas");
        return {};
    }

    std::vector<std::uint32_t> pixels(static_cast<std::size_t>(w) * h, 0);
    if (tvg_swcanvas_set_target(canvas.get(), pixels.data(), w, w, h,
        TVG_COLORSPACE_ABGR8888) != TVG_RESULT_SUCCESS) {
        chart_logger()->error("png_export: failed to set canvas target");
        return {};
    }

    // Opaque background, so premultiplied output equals straight RGBA.
    Tvg_Paint* background = tvg_shape_new();
    tvg_shape_append_rect(background, 0, 0, static_cast<float>(w), static_cast<float>(h), 0, 0);
    tvg_shape_set_fill_color(background, 255, 255, 255, 255);
    tvg_canvas_push(canvas.get(), background);

    Tvg_Paint* picture = tvg_picture_new();
    if (tvg_picture_load_data(picture, document.data(), static_cast<uint32_t>(document.size()),
        "svg", nullptr, true) != TVG_RESULT_SUCCESS) {
        chart_logger()->error("png_export: ThorVG rejected the SVG document ({} bytes)", document.size());
        tvg_paint_unref(picture, true);
        return {};
    }
    tvg_picture_set_size(picture, static_cast<float>(w), static_cast<float>(h));
    tvg_canvas_push(canvas.get(), picture);

    tvg_canvas_update(canvas.get());
    if (tvg_canvas_draw(canvas.get(), true) != TVG_RESULT_SUCCESS) {
        chart_logger()->error("png_export: draw failed");
        return {};
    }
    tvg_canvas_sync(canvas.get());

    // Destroying the canvas also frees the pushed paints.
    canvas.reset();
    return encode_png(pixels, w, h);
}

} // namespace canvas
