// Inline diagram viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include "buffer_view.hpp"
#include "gl_image_backend.hpp"
#include "viewer_host.hpp"
#include <diagram_config/options.hpp>
#include <diagram_jobs/process_jobs.hpp>
#include <diagram_jobs/tick_scheduler.hpp>
#include <diagram_log/log.hpp>
#include <diagram_session/session.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Arguments {
    std::vector<std::string> files;
    std::string config_path;
    std::string log_path;
};

std::optional<Arguments> parse_arguments(int argc, char* argv[]) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--config" || arg == "--log") && i + 1 < argc) {
            (arg == "--config" ? args.config_path : args.log_path) = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            return std::nullopt;
        } else {
            args.files.push_back(arg);
        }
    }
    if (args.files.empty()) return std::nullopt;
    return args;
}

const char* mode_name(viewer::Mode mode) {
    return mode == viewer::Mode::Insert ? "INSERT" : "NORMAL";
}

void handle_key(const SDL_KeyboardEvent& key, viewer::ViewerHost& host) {
    switch (key.key) {
    case SDLK_F5: (void)host.run_command("DiagramRender"); break;
    case SDLK_F6: (void)host.run_command("DiagramClear"); break;
    case SDLK_TAB: host.next_buffer(); break;
    case SDLK_UP: host.move_cursor(-1, 0); break;
    case SDLK_DOWN: host.move_cursor(1, 0); break;
    case SDLK_LEFT: host.move_cursor(0, -1); break;
    case SDLK_RIGHT: host.move_cursor(0, 1); break;
    case SDLK_I:
        if (host.mode() == viewer::Mode::Normal) host.set_mode(viewer::Mode::Insert);
        break;
    case SDLK_ESCAPE: host.set_mode(viewer::Mode::Normal); break;
    default: break;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    const auto args = parse_arguments(argc, argv);
    if (!args) {
        (void)fprintf(stderr, "usage: inline_diagrams [--config options.json] [--log file.log] <file>...\n");
        return 2;
    }
    if (!args->log_path.empty()) diagram_log::use_log_file(args->log_path);

    diagram_config::PluginOptions options;
    if (!args->config_path.empty()) {
        auto loaded = diagram_config::load_options_from_json_file(args->config_path);
        if (!loaded) {
            (void)fprintf(stderr, "invalid options file: %s\n", args->config_path.c_str());
            return 2;
        }
        options = std::move(*loaded);
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
    SDL_Window* window = SDL_CreateWindow("Inline diagrams", window_width, window_height, window_flags);
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
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;
    ImGui::StyleColorsDark();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 17.0f;
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
    };
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg) != nullptr)
            break;
    }

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    int exit_code = 0;
    {
        diagram_jobs::TickScheduler scheduler;
        diagram_jobs::ProcessJobs jobs;
        viewer::GlImageBackend images;
        viewer::ViewerHost host;
        diagram_session::Session session(host, &images, scheduler, jobs);
        viewer::BufferView view;

        if (!session.run_guarded("setup", [&]() { session.setup(options); })) {
            (void)fprintf(stderr, "setup failed: %s\n", host.last_message().c_str());
            exit_code = 1;
        }
        for (const auto& file : args->files) {
            if (exit_code != 0) break;
            if (!host.open_file(file)) {
                (void)fprintf(stderr, "cannot open %s\n", file.c_str());
            }
        }
        if (!host.current()) exit_code = 1;

        auto last_tick = std::chrono::steady_clock::now();
        bool running = exit_code == 0;
        while (running) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL3_ProcessEvent(&event);
                if (event.type == SDL_EVENT_QUIT)
                    running = false;
                if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                    event.window.windowID == SDL_GetWindowID(window))
                    running = false;
                if (event.type == SDL_EVENT_KEY_DOWN && !event.key.repeat)
                    handle_key(event.key, host);
            }

            // Timer callbacks (job polls) run here, between input handling and drawing.
            const auto now = std::chrono::steady_clock::now();
            scheduler.advance(std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick));
            last_tick = now;

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplSDL3_NewFrame();
            ImGui::NewFrame();

            ImGui::SetNextWindowPos(ImVec2(0, 0));
            ImGui::SetNextWindowSize(io.DisplaySize);
            ImGui::Begin("Buffer", nullptr,
                ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
                | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);
            const float status_height = ImGui::GetFrameHeightWithSpacing();
            ImVec2 avail = ImGui::GetContentRegionAvail();
            ImVec2 text_size(avail.x, avail.y - status_height);
            if (text_size.x > 0 && text_size.y > 0) {
                ImGui::BeginChild("text", text_size, false, ImGuiWindowFlags_NoScrollbar);
                view.draw(host, images, text_size.x, text_size.y);
                ImGui::EndChild();
            }
            if (const viewer::TextBuffer* current = host.current()) {
                ImGui::Text("-- %s --  %s [%s]  %d:%d  jobs:%zu  %s",
                    mode_name(host.mode()), current->path.filename().string().c_str(),
                    current->filetype.c_str(), current->cursor_row + 1, current->cursor_col + 1,
                    session.pending_jobs(), host.last_message().c_str());
            }
            ImGui::End();

            ImGui::Render();
            SDL_GL_MakeCurrent(window, gl_context);
            // HiDPI: use framebuffer size in pixels, not logical DisplaySize
            const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
            const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
            glViewport(0, 0, fb_w, fb_h);
            glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            SDL_GL_SwapWindow(window);
        }

        // Images own GL textures; release them while the context is alive.
        session.teardown();
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return exit_code;
}
