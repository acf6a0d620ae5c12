// Marker motion viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include "sdl_motion_host.hpp"
#include <map_canvas/map_canvas.hpp>
#include <marker_loaders/json_loader.hpp>
#include <marker_motion/marker_motion.hpp>
#include <marker_motion/motion_log.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Options {
    std::string script_path;
    std::string log_file;
    bool verbose = false;
};

Options parse_options(int argc, char* argv[]) {
    Options out;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--verbose") {
            out.verbose = true;
        } else if (arg == "--log-file" && i + 1 < argc) {
            out.log_file = argv[++i];
        } else {
            out.script_path = arg;
        }
    }
    return out;
}

// Replays script steps against the engine, looping after the last step.
class ScriptPlayer {
public:
    explicit ScriptPlayer(const marker_loaders::MarkerScript& script) : script_(script) {}

    void restart(marker_motion::Timestamp now) {
        started_at_ = now;
        next_step_ = 0;
    }

    void advance(marker_motion::Timestamp now, marker_motion::MarkerMotion& motion) {
        if (script_.steps.empty()) return;
        const auto elapsed = now - started_at_;
        while (next_step_ < script_.steps.size() && elapsed >= script_.steps[next_step_].at) {
            const auto& step = script_.steps[next_step_];
            if (step.config)
                motion.update(step.markers, *step.config);
            else
                motion.update(step.markers);
            ++next_step_;
        }
        if (next_step_ >= script_.steps.size() && elapsed >= script_.steps.back().at + kLoopPause) {
            motion.set_config(script_.config);
            restart(now);
        }
    }

    std::size_t next_step() const { return next_step_; }
    std::size_t step_count() const { return script_.steps.size(); }

private:
    static constexpr std::chrono::milliseconds kLoopPause{2000};

    const marker_loaders::MarkerScript& script_;
    marker_motion::Timestamp started_at_{0};
    std::size_t next_step_ = 0;
};

void draw_status(const marker_motion::MarkerMotion& motion, const ScriptPlayer& player) {
    const auto& config = motion.config();
    ImGui::SetNextWindowPos(ImVec2(12, 12), ImGuiCond_Always);
    ImGui::SetNextWindowBgAlpha(0.75f);
    ImGui::Begin("Motion", nullptr,
        ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoMove);
    ImGui::Text("implementation: %s", marker_motion::to_string(config.implementation()));
    ImGui::Text("duration: %lld ms", static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(config.duration()).count()));
    ImGui::Text("curve: %s", config.curve().name().c_str());
    if (config.implementation() == marker_motion::MotionImplementation::TimerDriven)
        ImGui::Text("frame rate: %d", config.frame_rate());
    ImGui::Separator();
    ImGui::Text("markers: %zu  active: %zu", motion.store().size(), motion.active_animation_count());
    ImGui::Text("clock: %s", motion.is_ticking() ? "ticking" : "idle");
    ImGui::Text("step: %zu / %zu", player.next_step(), player.step_count());
    ImGui::End();
}

} // namespace

int main(int argc, char* argv[])
{
    const Options options = parse_options(argc, argv);
    if (options.verbose)
        marker_motion::motion_logger()->set_level(spdlog::level::debug);
    if (!options.log_file.empty())
        marker_motion::set_motion_log_file(options.log_file);

    std::optional<marker_loaders::MarkerScript> script;
    if (!options.script_path.empty()) {
        try {
            script = marker_loaders::load_marker_script_from_json_file(options.script_path);
        } catch (const marker_motion::MotionConfigError& e) {
            (void)fprintf(stderr, "Invalid motion config in %s: %s\n", options.script_path.c_str(), e.what());
            return 1;
        }
        if (!script) {
            (void)fprintf(stderr, "Cannot load marker script %s\n", options.script_path.c_str());
            return 1;
        }
    } else {
        script = marker_loaders::demo_marker_script();
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

    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Marker motion", 1280, 720, window_flags);
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
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    map_canvas::MapCanvas canvas;
    SdlMotionHost host;
    {
        marker_motion::MarkerMotion motion(host, script->config,
            [&canvas](const std::vector<marker_model::Marker>& markers) { canvas.set_markers(markers); });
        ScriptPlayer player(*script);
        player.restart(host.now());

        bool focused = false;
        bool running = true;
        while (running) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL3_ProcessEvent(&event);
                if (event.type == SDL_EVENT_QUIT)
                    running = false;
                if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                    event.window.windowID == SDL_GetWindowID(window))
                    running = false;
            }

            player.advance(host.now(), motion);
            host.run_frame();

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplSDL3_NewFrame();
            ImGui::NewFrame();

            ImGui::SetNextWindowPos(ImVec2(0, 0));
            ImGui::SetNextWindowSize(io.DisplaySize);
            ImGui::Begin("Map", nullptr,
                ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
                | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);
            ImVec2 canvas_size = ImGui::GetContentRegionAvail();
            if (canvas_size.x > 0 && canvas_size.y > 0) {
                if (!focused && !canvas.markers().empty()) {
                    canvas.focus_on(canvas.markers().front().position, canvas_size.x, canvas_size.y);
                    focused = true;
                }
                ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar);
                canvas.update_and_draw(canvas_size.x, canvas_size.y);
                ImGui::EndChild();
            }
            ImGui::End();
            draw_status(motion, player);

            ImGui::Render();
            SDL_GL_MakeCurrent(window, gl_context);
            const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
            const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
            glViewport(0, 0, fb_w, fb_h);
            glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            SDL_GL_SwapWindow(window);
        }
        // The engine is disposed here, before the host and the GL context go away.
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
