#include "app_config.hpp"
#include "cli_benchmark.hpp"
#include "engine.hpp"
#include "log.hpp"

#ifdef FRACTAL_STUDIO_GUI
#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"
#include "app_state.hpp"
#include "ui_panels.hpp"
#endif

#include <algorithm>
#include <cstdio>
#include <vector>

#ifdef FRACTAL_STUDIO_GUI

static const float PANEL_WIDTH   = 280.0f;
static const float STATUS_HEIGHT = 24.0f;

// ---------------------------------------------------------------------------
// Touch: SDL reports fingers in normalized window coordinates
// ---------------------------------------------------------------------------
static void handle_touch(AppState& app, const SDL_Event& event, int win_w, int win_h)
{
    const SDL_TouchFingerEvent& f = event.tfinger;
    const Vec2 p{f.x * win_w - app.render_x, f.y * win_h - app.render_y};

    if (event.type == SDL_FINGERUP) app.fingers.erase(f.fingerId);
    else                            app.fingers[f.fingerId] = p;

    std::vector<Vec2> points;
    for (const auto& kv : app.fingers) points.push_back(kv.second);

    InputController& in = app.engine.input();
    const int count = static_cast<int>(points.size());
    switch (event.type) {
        case SDL_FINGERDOWN:
            in.touch_start(count, points.data());
            break;
        case SDL_FINGERMOTION:
            in.touch_move(count, points.data());
            break;
        case SDL_FINGERUP:
            // Remaining fingers restart the gesture
            if (count > 0) in.touch_start(count, points.data());
            else           in.touch_end();
            break;
        default:
            break;
    }
}

static int run_gui(const AppConfig& cfg, Engine& engine)
{
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        fractal_log().error("SDL_Init error: {}", SDL_GetError());
        return 1;
    }

    SDL_SetHint(SDL_HINT_TOUCH_MOUSE_EVENTS, "0");
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    SDL_Window* window = SDL_CreateWindow(
        "Fractal Studio",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        cfg.window_w, cfg.window_h,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI
    );
    if (!window) {
        fractal_log().error("SDL_CreateWindow error: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        fractal_log().error("SDL_GL_CreateContext error: {}", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_MakeCurrent(window, gl_context);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();

    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.WindowPadding    = ImVec2(8.0f, 6.0f);

    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");

    {
        AppState app(engine);
        app.window     = window;
        app.thread_sel = cfg.threads;

        Uint64 last_tick = SDL_GetPerformanceCounter();
        std::string last_title;

        while (app.running) {
            int win_w, win_h;
            SDL_GetWindowSize(window, &win_w, &win_h);

            // Block while idle; poll while the view is still animating.
            const bool animating = !engine.viewport().settled() || app.bench.running;
            SDL_Event event;
            if (SDL_WaitEventTimeout(&event, animating ? 1 : 50)) {
                do {
                    ImGui_ImplSDL2_ProcessEvent(&event);
                    switch (event.type) {
                        case SDL_QUIT:
                            app.running = false;
                            break;
                        case SDL_WINDOWEVENT:
                            if (event.window.event == SDL_WINDOWEVENT_FOCUS_LOST)
                                engine.input().release_all_keys();
                            break;
                        case SDL_FINGERDOWN:
                        case SDL_FINGERMOTION:
                        case SDL_FINGERUP:
                            handle_touch(app, event, win_w, win_h);
                            break;
                        default:
                            break;
                    }
                } while (SDL_PollEvent(&event));
            }

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            int draw_w, draw_h;
            SDL_GL_GetDrawableSize(window, &draw_w, &draw_h);
            const float  fw     = static_cast<float>(win_w);
            const float  fh     = static_cast<float>(win_h);
            const float  menu_h = ImGui::GetFrameHeight();
            const double dpr    = win_w > 0 ? static_cast<double>(draw_w) / win_w : 1.0;

            app.render_x = PANEL_WIDTH;
            app.render_y = menu_h;
            app.render_w = std::max(1.0f, fw - PANEL_WIDTH);
            app.render_h = std::max(1.0f, fh - menu_h - STATUS_HEIGHT);
            engine.resize(static_cast<int>(app.render_w), static_cast<int>(app.render_h), dpr);

            handle_keyboard(app, io);
            draw_menu_bar(app);
            draw_side_panel(app, io, menu_h, fh);

            // Frame pipeline, then upload if the image changed
            const Uint64 now = SDL_GetPerformanceCounter();
            const double dt  = static_cast<double>(now - last_tick) / SDL_GetPerformanceFrequency();
            last_tick = now;
            if (engine.frame(dt))
                app.render_tex.upload(engine.framebuffer());

            draw_render_region(app, io);
            draw_status_bar(app, fw, fh);
            draw_export_dialog(app);
            draw_session_dialogs(app);
            draw_benchmark_dialog(app);
            draw_about_dialog(app);

            char title[128];
            std::snprintf(title, sizeof(title), "Fractal Studio  -  %s  [zoom: %.2fx]",
                          fractal_name(engine.fractal()), engine.viewport().live().zoom);
            if (last_title != title) {
                SDL_SetWindowTitle(window, title);
                last_title = title;
            }

            ImGui::Render();
            glViewport(0, 0, draw_w, draw_h);
            glClearColor(0.08f, 0.08f, 0.08f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            SDL_GL_SwapWindow(window);
        }
    }  // GL texture released while the context is current

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
#endif  // FRACTAL_STUDIO_GUI

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    const ConfigResult parsed = parse_args(argc, argv);
    const AppConfig&   cfg    = parsed.config;

    set_log_level(cfg.log_level);
    for (const auto& w : parsed.warnings)
        fractal_log().warn("{}", w);

    if (cfg.show_help) {
        print_usage(argv[0]);
        return 0;
    }
    if (cfg.benchmark)
        return run_cli_benchmark(cfg);
    if (!cfg.render_path.empty())
        return run_cli_render(cfg);

    EngineOptions opt;
    opt.threads = cfg.threads;
    opt.initial = cfg.fractal;
    Engine engine(opt);
    engine.set_max_iterations(cfg.iterations);
    engine.set_render_scale(cfg.render_scale);
    if (!cfg.session_path.empty() && !engine.load_session(cfg.session_path).empty())
        fractal_log().warn("Starting with default settings");

#ifdef FRACTAL_STUDIO_GUI
    return run_gui(cfg, engine);
#else
    fractal_log().error("Built without the GUI; use --render FILE or --benchmark");
    return 1;
#endif
}
