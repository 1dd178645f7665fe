// Pedigree chart viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <canvas/canvas_controller.hpp>
#include <canvas/overlay.hpp>
#include <canvas/task_scheduler.hpp>
#include <chart_nodes/person_node.hpp>
#include <chart_render/renderer.hpp>
#include <display_records/record_builder.hpp>
#include <pedigree_loaders/json_loader.hpp>
#include <pedigree_loaders/sample_chart.hpp>
#include <svg_scene/element.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace {

struct PlacedPerson {
    pedigree_model::DisplayRecord record;
    double x = 0;
    double y = 0;
    svg_scene::Element* element = nullptr;
};

struct Options {
    std::string config_path;
    std::string individuals_path;
    std::string export_format;
    std::string export_path;
};

bool parse_options(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--individuals" && i + 1 < argc) {
            options.individuals_path = argv[++i];
        } else if (arg == "--export" && i + 2 < argc) {
            options.export_format = argv[++i];
            options.export_path = argv[++i];
        } else {
            (void)fprintf(stderr,
                "usage: %s [--config <file>] [--individuals <file>] [--export <svg|png> <path>]\n", argv[0]);
            return false;
        }
    }
    return true;
}

pedigree_model::Configuration load_configuration(const Options& options) {
    std::vector<std::string> paths;
    if (!options.config_path.empty()) paths.push_back(options.config_path);
    paths.push_back("data/chart_config.json");
    paths.push_back("chart_config.json");
    for (const auto& path : paths) {
        if (auto loaded = pedigree_loaders::load_configuration_from_json_file(path)) {
            spdlog::info("configuration loaded from {}", path);
            return *loaded;
        }
    }
    spdlog::info("no configuration file found, using defaults");
    return {};
}

std::vector<pedigree_loaders::ChartEntry> load_entries(const Options& options) {
    std::vector<std::string> paths;
    if (!options.individuals_path.empty()) paths.push_back(options.individuals_path);
    paths.push_back("data/example_pedigree.json");
    paths.push_back("example_pedigree.json");
    for (const auto& path : paths) {
        if (auto loaded = pedigree_loaders::load_individuals_from_json_file(path)) {
            spdlog::info("{} individuals loaded from {}", loaded->size(), path);
            return std::move(*loaded);
        }
    }
    spdlog::info("no individuals file found, using the sample chart");
    return pedigree_loaders::generate_sample_chart();
}

PlacedPerson* person_at(std::vector<PlacedPerson>& people, const canvas::Zoom& zoom, float sx, float sy) {
    double wx = 0.0;
    double wy = 0.0;
    zoom.transform().invert(sx, sy, wx, wy);
    for (auto it = people.rbegin(); it != people.rend(); ++it) {
        if (std::abs(wx - it->x) <= chart_nodes::box::width * 0.5
            && std::abs(wy - it->y) <= chart_nodes::box::height * 0.5)
            return &*it;
    }
    return nullptr;
}

int export_headless(const canvas::CanvasController& controller, const pedigree_model::Configuration& config,
    const Options& options)
{
    try {
        auto exporter = controller.export_as(options.export_format);
        const bool ok = exporter->save(controller.element(), config.export_width, config.export_height,
            options.export_path);
        return ok ? 0 : 1;
    } catch (const canvas::UnsupportedExportFormat& e) {
        (void)fprintf(stderr, "%s\n", e.what());
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    Options options;
    if (!parse_options(argc, argv, options)) return 1;

    const pedigree_model::Configuration config = load_configuration(options);
    const display_records::RecordOptions record_options = display_records::record_options_from(config);

    svg_scene::Element container("div");
    canvas::CanvasController controller(container, config);
    controller.initialize();

    canvas::TaskScheduler scheduler;
    canvas::HintOverlay overlay(scheduler);
    controller.initialize_interaction(overlay);

    std::vector<PlacedPerson> people;
    for (const auto& entry : load_entries(options)) {
        PlacedPerson p;
        p.record = display_records::build_display_record(entry.individual, entry.generation, record_options);
        p.x = entry.individual.x;
        p.y = entry.individual.y;
        people.push_back(std::move(p));
    }
    for (std::size_t i = 0; i < people.size(); ++i) {
        people[i].record.id = static_cast<int>(i) + 1;
        people[i].element = &chart_nodes::append_person(*controller.visual(), controller.defs(),
            people[i].record, people[i].x, people[i].y, config,
            [](const pedigree_model::DisplayRecord& r) {
                spdlog::info("person clicked xref={} url={}", r.xref, r.url);
            });
    }

    if (!options.export_format.empty()) {
        // Center the chart in the export area.
        controller.zoom()->set_transform({ 1.0, config.export_width * 0.25, config.export_height * 0.5 });
        return export_headless(controller, config, options);
    }

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    // Default fallback if display bounds are unavailable.
    int window_width = 1280;
    int window_height = 720;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Pedigree chart", window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;

    ImGui::StyleColorsLight();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 17.0f;
    // DejaVu covers Hebrew and Arabic alternate names.
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
    };
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg, io.Fonts->GetGlyphRangesDefault()) != nullptr)
            break;
    }

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    svg_scene::Element& svg = controller.element();
    canvas::Zoom& zoom = *controller.zoom();
    zoom.set_transform({ 1.0, window_width * 0.25, window_height * 0.5 });

    ImVec2 canvas_origin(0, 0);
    float last_pinch_distance = 0.0f;
    bool running = true;

    auto dispatch = [&](svg_scene::Event& e, svg_scene::Element& target) {
        svg_scene::Element::dispatch(target, e);
    };

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;

            const bool ctrl = (SDL_GetModState() & SDL_KMOD_CTRL) != 0;
            switch (event.type) {
            case SDL_EVENT_MOUSE_WHEEL: {
                svg_scene::Event e(svg_scene::EventType::Wheel);
                e.x = event.wheel.mouse_x - canvas_origin.x;
                e.y = event.wheel.mouse_y - canvas_origin.y;
                e.wheel_delta = event.wheel.y;
                e.ctrl_key = ctrl;
                dispatch(e, svg);
                break;
            }
            case SDL_EVENT_MOUSE_BUTTON_DOWN: {
                const bool right = event.button.button == SDL_BUTTON_RIGHT;
                svg_scene::Event e(right ? svg_scene::EventType::ContextMenu : svg_scene::EventType::PointerDown);
                e.x = event.button.x - canvas_origin.x;
                e.y = event.button.y - canvas_origin.y;
                e.button = event.button.button - SDL_BUTTON_LEFT;
                dispatch(e, svg);
                break;
            }
            case SDL_EVENT_MOUSE_MOTION: {
                svg_scene::Event e(svg_scene::EventType::PointerMove);
                e.x = event.motion.x - canvas_origin.x;
                e.y = event.motion.y - canvas_origin.y;
                dispatch(e, svg);
                break;
            }
            case SDL_EVENT_MOUSE_BUTTON_UP: {
                if (event.button.button != SDL_BUTTON_LEFT) break;
                const float x = event.button.x - canvas_origin.x;
                const float y = event.button.y - canvas_origin.y;
                svg_scene::Event up(svg_scene::EventType::PointerUp);
                up.x = x;
                up.y = y;
                dispatch(up, svg);

                svg_scene::Event click(svg_scene::EventType::Click);
                click.x = x;
                click.y = y;
                PlacedPerson* hit = person_at(people, zoom, x, y);
                dispatch(click, hit ? *hit->element : svg);
                break;
            }
            case SDL_EVENT_FINGER_MOTION:
            case SDL_EVENT_FINGER_UP: {
                int count = 0;
                SDL_Finger** fingers = SDL_GetTouchFingers(event.tfinger.touchID, &count);
                svg_scene::Event e(event.type == SDL_EVENT_FINGER_UP
                    ? svg_scene::EventType::TouchEnd : svg_scene::EventType::TouchMove);
                e.touch_count = count;
                e.x = event.tfinger.x * io.DisplaySize.x - canvas_origin.x;
                e.y = event.tfinger.y * io.DisplaySize.y - canvas_origin.y;
                if (fingers && count >= 2) {
                    const float dx = (fingers[0]->x - fingers[1]->x) * io.DisplaySize.x;
                    const float dy = (fingers[0]->y - fingers[1]->y) * io.DisplaySize.y;
                    const float distance = std::sqrt(dx * dx + dy * dy);
                    e.x = (fingers[0]->x + fingers[1]->x) * 0.5f * io.DisplaySize.x - canvas_origin.x;
                    e.y = (fingers[0]->y + fingers[1]->y) * 0.5f * io.DisplaySize.y - canvas_origin.y;
                    if (last_pinch_distance > 0.0f && distance > 0.0f)
                        e.pinch_scale = distance / last_pinch_distance;
                    last_pinch_distance = distance;
                } else {
                    last_pinch_distance = 0.0f;
                }
                SDL_free(fingers);
                dispatch(e, svg);
                break;
            }
            case SDL_EVENT_KEY_DOWN: {
                if (ctrl && (event.key.key == SDLK_S || event.key.key == SDLK_P)) {
                    const char* format = event.key.key == SDLK_S ? "svg" : "png";
                    const std::string path = std::string("pedigree_chart.") + format;
                    if (controller.export_as(format)->save(svg, io.DisplaySize.x, io.DisplaySize.y, path))
                        spdlog::info("chart exported to {}", path);
                    else
                        spdlog::error("chart export to {} failed", path);
                } else if (event.key.key == SDLK_0) {
                    zoom.set_transform({ 1.0, io.DisplaySize.x * 0.25, io.DisplaySize.y * 0.5 });
                }
                break;
            }
            default:
                break;
            }
        }

        scheduler.advance_to(SDL_GetTicks());
        overlay.tick(io.DeltaTime);

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Pedigree", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);
        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar);
            canvas_origin = ImGui::GetCursorScreenPos();
            ImDrawList* draw_list = ImGui::GetWindowDrawList();
            chart_render::render_scene(draw_list, svg, *controller.visual(), zoom.transform(),
                canvas_origin.x, canvas_origin.y);
            chart_render::render_overlay(draw_list, overlay, canvas_origin.x, canvas_origin.y, canvas_size.x);
            ImGui::EndChild();
        }
        ImGui::End();

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        // HiDPI: use framebuffer size in pixels, not logical DisplaySize
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.96f, 0.96f, 0.97f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
