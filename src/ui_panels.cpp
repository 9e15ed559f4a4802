#include "ui_panels.hpp"
#include "app_state.hpp"
#include "escape_time.hpp"
#include "export.hpp"
#include "fractal.hpp"
#include "log.hpp"
#include "palette.hpp"
#include "presets.hpp"
#include "session.hpp"
#include "imgui.h"

#include <algorithm>
#include <cstdio>
#include <string>

static const float PANEL_WIDTH   = 280.0f;
static const float STATUS_HEIGHT = 24.0f;

static const ImGuiWindowFlags FIXED_WINDOW =
    ImGuiWindowFlags_NoTitleBar |
    ImGuiWindowFlags_NoResize   |
    ImGuiWindowFlags_NoMove     |
    ImGuiWindowFlags_NoBringToFrontOnFocus;

static void section(const char* label)
{
    ImGui::Spacing();
    ImGui::TextDisabled("%s", label);
    ImGui::Separator();
}

static void open_export(AppState& app)
{
    app.show_export = true;
    app.exp_done    = false;
    app.exp_msg.clear();
}

static void choose_fractal(AppState& app, FractalKind kind)
{
    app.failed_kind = app.engine.set_fractal(kind) ? -1 : static_cast<int>(kind);
}

void toggle_fullscreen(AppState& app)
{
    const Uint32 flags = app.fullscreen ? 0 : SDL_WINDOW_FULLSCREEN_DESKTOP;
    if (SDL_SetWindowFullscreen(app.window, flags) == 0)
        app.fullscreen = !app.fullscreen;
    else
        fractal_log().warn("Fullscreen toggle failed: {}", SDL_GetError());
}

// ---------------------------------------------------------------------------
// Menu bar
// ---------------------------------------------------------------------------
void draw_menu_bar(AppState& app)
{
    Engine& e = app.engine;
    if (!ImGui::BeginMainMenuBar()) return;

    if (ImGui::BeginMenu("File")) {
        if (ImGui::MenuItem("Export Image", "Ctrl+S")) open_export(app);
        ImGui::Separator();
        if (ImGui::MenuItem("Save Session...")) {
            app.show_save    = true;
            app.session_done = false;
        }
        if (ImGui::MenuItem("Load Session...")) {
            app.show_load    = true;
            app.session_done = false;
        }
        ImGui::Separator();
        if (ImGui::MenuItem("Exit")) app.running = false;
        ImGui::EndMenu();
    }
    if (ImGui::BeginMenu("View")) {
        if (ImGui::MenuItem("Reset View", "Ctrl+R")) e.reset_view();
        if (ImGui::MenuItem("Fullscreen", "F11", app.fullscreen)) toggle_fullscreen(app);
        ImGui::EndMenu();
    }
    if (ImGui::BeginMenu("Threads")) {
        CpuRenderer& renderer = e.renderer();
        const int hw = renderer.hw_concurrency;
        char buf[32];
        std::snprintf(buf, sizeof(buf), "Auto (%d)", hw);
        if (ImGui::MenuItem(buf, nullptr, app.thread_sel == 0)) {
            app.thread_sel = 0;
            renderer.set_thread_count(0);
            e.invalidate();
        }
        ImGui::Separator();
        for (int i = 1; i <= hw; ++i) {
            std::snprintf(buf, sizeof(buf), "%d", i);
            if (ImGui::MenuItem(buf, nullptr, app.thread_sel == i)) {
                app.thread_sel = i;
                renderer.set_thread_count(i);
                e.invalidate();
            }
        }
        ImGui::EndMenu();
    }
    if (ImGui::BeginMenu("Help")) {
        if (ImGui::MenuItem("Benchmark")) app.show_benchmark = true;
        ImGui::Separator();
        if (ImGui::MenuItem("About", "F1")) app.show_about = true;
        ImGui::EndMenu();
    }
    ImGui::EndMainMenuBar();
}

// ---------------------------------------------------------------------------
// Side panel
// ---------------------------------------------------------------------------
static void draw_fractal_selector(AppState& app)
{
    Engine& e = app.engine;
    const FractalKind cur = e.fractal();

    section("FRACTAL");
    ImGui::SetNextItemWidth(-1.0f);
    if (ImGui::BeginCombo("##fractal", fractal_name(cur))) {
        for (int i = 0; i < FRACTAL_KIND_COUNT; ++i) {
            const auto  kind = static_cast<FractalKind>(i);
            std::string label = fractal_name(kind);
            if (!e.available(kind)) label += "  (unavailable)";
            if (ImGui::Selectable(label.c_str(), kind == cur))
                choose_fractal(app, kind);
            if (!e.available(kind) && ImGui::IsItemHovered())
                ImGui::SetTooltip("%s", e.init_error(kind).c_str());
        }
        ImGui::EndCombo();
    }
    ImGui::Text("%s", equation(e.params()).c_str());
    ImGui::PushTextWrapPos(0.0f);
    ImGui::TextDisabled("%s", description(cur));
    ImGui::PopTextWrapPos();
}

static void draw_quality(Engine& e)
{
    section("QUALITY");
    if (is_escape_time(e.fractal())) {
        int iter = e.max_iterations();
        ImGui::Text("Iterations");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderInt("##iter", &iter, 1, MAX_ITERATIONS_CAP, "%d",
                             ImGuiSliderFlags_Logarithmic))
            e.set_max_iterations(iter);

        double radius = e.escape_radius();
        ImGui::Text("Escape radius");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderScalar("##radius", ImGuiDataType_Double, &radius,
                                &MIN_ESCAPE_RADIUS, &MAX_ESCAPE_RADIUS, "%.2f",
                                ImGuiSliderFlags_Logarithmic))
            e.set_escape_radius(radius);

        bool smooth = e.smooth();
        if (ImGui::Checkbox("Smooth coloring", &smooth))
            e.set_smooth(smooth);

        static const char* precision_labels[] = {"Auto", "Standard", "Compensated"};
        int p = static_cast<int>(e.precision_mode());
        ImGui::Text("Precision");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##precision", &p, precision_labels, PRECISION_MODE_COUNT))
            e.set_precision_mode(static_cast<PrecisionMode>(p));
    }

    double scale = e.render_scale();
    ImGui::Text("Render scale");
    ImGui::SetNextItemWidth(-1.0f);
    if (ImGui::SliderScalar("##scale", ImGuiDataType_Double, &scale,
                            &MIN_RENDER_SCALE, &MAX_RENDER_SCALE, "%.2fx"))
        e.set_render_scale(scale);
}

static void draw_colors(Engine& e, const ImGuiIO& io)
{
    const FractalKind kind = e.fractal();
    section("COLOR SCHEME");
    ImGui::SetNextItemWidth(-1.0f);
    const int cur = e.color_scheme();
    if (ImGui::BeginCombo("##scheme", palette_name(kind, cur))) {
        for (int i = 0; i < palette_count(kind); ++i)
            if (ImGui::Selectable(palette_name(kind, i), i == cur))
                e.set_color_scheme(i);
        ImGui::EndCombo();
    }
    if (ImGui::IsItemHovered() && io.MouseWheel != 0.0f)
        e.set_color_scheme(cur + (io.MouseWheel < 0.0f ? 1 : -1));
}

static void draw_julia(Engine& e)
{
    section("JULIA CONSTANT");
    Complex c = e.julia_constant();
    ImGui::Text("re:"); ImGui::SameLine();
    ImGui::SetNextItemWidth(-1.0f);
    if (ImGui::InputDouble("##jre", &c.re, 0.001, 0.01, "%.8f"))
        e.set_julia_constant(c);
    ImGui::Text("im:"); ImGui::SameLine();
    ImGui::SetNextItemWidth(-1.0f);
    if (ImGui::InputDouble("##jim", &c.im, 0.001, 0.01, "%.8f"))
        e.set_julia_constant(c);

    ImGui::SetNextItemWidth(-1.0f);
    if (ImGui::BeginCombo("##jpreset", "Presets...")) {
        for (int i = 0; i < JULIA_PRESET_COUNT; ++i)
            if (ImGui::Selectable(JULIA_PRESETS[i].name))
                e.apply_julia_preset(JULIA_PRESETS[i].name);
        ImGui::EndCombo();
    }

    if (e.fractal() == FractalKind::Mandelbrot) {
        ImGui::PushTextWrapPos(0.0f);
        ImGui::TextDisabled("Right-click the view to use the point under the cursor");
        ImGui::PopTextWrapPos();
    } else if (e.statistics().connected) {
        ImGui::TextDisabled("Connected (c lies in the Mandelbrot set)");
    } else {
        ImGui::TextDisabled("Disconnected (c escapes)");
    }
}

static void draw_points_of_interest(Engine& e)
{
    section("POINTS OF INTEREST");
    for (int i = 0; i < MANDELBROT_POINT_COUNT; ++i) {
        const PointOfInterest& p = MANDELBROT_POINTS[i];
        if (ImGui::Button(p.name, ImVec2(-1.0f, 0.0f)))
            e.apply_point_of_interest(p.name);
    }
}

static void draw_geometry(Engine& e)
{
    const FractalKind kind = e.fractal();
    section("GEOMETRY");

    int depth = e.depth();
    ImGui::Text("Recursion depth");
    ImGui::SetNextItemWidth(-1.0f);
    if (ImGui::SliderInt("##depth", &depth, min_depth(kind), max_depth(kind)))
        e.set_depth(depth);

    if (kind != FractalKind::Tree) return;

    double angle = e.branch_angle();
    ImGui::Text("Branch angle");
    ImGui::SetNextItemWidth(-1.0f);
    if (ImGui::SliderScalar("##angle", ImGuiDataType_Double, &angle,
                            &TREE_MIN_ANGLE, &TREE_MAX_ANGLE, "%.1f deg"))
        e.set_branch_angle(angle);

    double ratio = e.length_ratio();
    ImGui::Text("Length ratio");
    ImGui::SetNextItemWidth(-1.0f);
    if (ImGui::SliderScalar("##ratio", ImGuiDataType_Double, &ratio,
                            &TREE_MIN_RATIO, &TREE_MAX_RATIO, "%.2f"))
        e.set_length_ratio(ratio);
}

static void draw_statistics(Engine& e)
{
    const FractalStats& s = e.statistics();
    section("STATISTICS");
    if (is_escape_time(e.fractal())) {
        ImGui::Text("In set:     %.2f %%", s.area_ratio * 100.0);
        ImGui::Text("Escaped:    %.2f %%", s.convergence_ratio * 100.0);
    } else if (e.fractal() == FractalKind::Sierpinski) {
        ImGui::Text("Area:       %.4f", s.area_ratio);
    }
    ImGui::Text("Boundary:   %lld", s.boundary_points);
    ImGui::Text("Dimension:  %.4f", s.fractal_dimension);
    ImGui::Text("Render:     %.1f ms", s.render_ms);

    if (e.iteration_hint() > 0) {
        ImGui::Spacing();
        ImGui::PushTextWrapPos(0.0f);
        ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.3f, 1.0f),
                           "Detail may be missing at this zoom; try %d iterations.",
                           e.iteration_hint());
        ImGui::PopTextWrapPos();
        if (ImGui::Button("Apply##hint", ImVec2(-1.0f, 0.0f)))
            e.set_max_iterations(e.iteration_hint());
    }
    if (e.extreme_zoom()) {
        ImGui::Spacing();
        ImGui::PushTextWrapPos(0.0f);
        ImGui::TextColored(ImVec4(1.0f, 0.35f, 0.35f, 1.0f),
                           "Extreme zoom: rendering may be slow.");
        ImGui::PopTextWrapPos();
    }
}

void draw_side_panel(AppState& app, const ImGuiIO& io, float menu_h, float fh)
{
    Engine& e = app.engine;

    ImGui::SetNextWindowPos(ImVec2(0.0f, menu_h));
    ImGui::SetNextWindowSize(ImVec2(PANEL_WIDTH, fh - menu_h - STATUS_HEIGHT));
    ImGui::Begin("##panel", nullptr, FIXED_WINDOW);

    draw_fractal_selector(app);
    draw_quality(e);
    draw_colors(e, io);

    if (is_escape_time(e.fractal())) {
        draw_julia(e);
        draw_points_of_interest(e);
    } else {
        draw_geometry(e);
    }

    section("VIEW");
    ImGui::Text("Zoom:      %.4gx", e.zoom());
    ImGui::Text("Rotation:  %.1f deg", e.rotation() * 180.0 / 3.14159265358979323846);
    if (ImGui::Button("Reset view", ImVec2(-1.0f, 0.0f)))
        e.reset_view();

    draw_statistics(e);

    ImGui::End();  // ##panel
}

// ---------------------------------------------------------------------------
// Render region: framebuffer image, pointer and wheel input
// ---------------------------------------------------------------------------
void draw_render_region(AppState& app, const ImGuiIO& io)
{
    Engine& e = app.engine;

    ImGui::SetNextWindowPos(ImVec2(app.render_x, app.render_y));
    ImGui::SetNextWindowSize(ImVec2(app.render_w, app.render_h));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
    ImGui::Begin("##render", nullptr, FIXED_WINDOW | ImGuiWindowFlags_NoScrollbar);
    ImGui::PopStyleVar();

    if (app.failed_kind >= 0) {
        const auto kind = static_cast<FractalKind>(app.failed_kind);
        ImGui::SetCursorPos(ImVec2(24.0f, 24.0f));
        ImGui::PushTextWrapPos(app.render_w - 24.0f);
        ImGui::TextColored(ImVec4(1.0f, 0.35f, 0.35f, 1.0f),
                           "%s failed to initialize: %s",
                           fractal_name(kind), e.init_error(kind).c_str());
        ImGui::TextDisabled("Choose another fractal from the side panel.");
        ImGui::PopTextWrapPos();
        ImGui::End();
        return;
    }

    if (app.render_tex.id)
        ImGui::Image(app.render_tex.imgui_id(), ImVec2(app.render_w, app.render_h));

    InputController& in = e.input();
    const bool   hovered = ImGui::IsWindowHovered();
    const double mx      = io.MousePos.x - app.render_x;
    const double my      = io.MousePos.y - app.render_y;

    if (hovered && io.MouseWheel != 0.0f)
        in.wheel(-io.MouseWheel, mx, my);

    if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
        in.pointer_down(mx, my);
        app.pointer_captured = true;
    }
    if (app.pointer_captured) {
        if (ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
            if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f)
                in.pointer_move(mx, my);
        } else {
            in.pointer_up();
            app.pointer_captured = false;
        }
    }

    if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Right))
        e.julia_from_screen_point(mx, my);

    ImGui::End();  // ##render
}

// ---------------------------------------------------------------------------
// Status bar
// ---------------------------------------------------------------------------
void draw_status_bar(AppState& app, float fw, float fh)
{
    Engine& e = app.engine;
    const ViewCamera&      cam = e.viewport().live();
    const QualityDecision& q   = e.quality();

    ImGui::SetNextWindowPos(ImVec2(0.0f, fh - STATUS_HEIGHT));
    ImGui::SetNextWindowSize(ImVec2(fw, STATUS_HEIGHT));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(6.0f, 4.0f));
    ImGui::Begin("##status", nullptr, FIXED_WINDOW | ImGuiWindowFlags_NoScrollbar);
    ImGui::PopStyleVar();
    if (is_escape_time(e.fractal())) {
        ImGui::Text("re: %.12f   im: %.12f   zoom: %.4gx   rot: %.1f deg   iter: %d   %s   %dx%d   %.0f ms  [%s  %dt]",
                    cam.center.re, cam.center.im, cam.zoom,
                    cam.rotation * 180.0 / 3.14159265358979323846, q.iterations,
                    q.compensated ? "compensated" : "standard",
                    q.samples, q.samples, e.last_render_ms(),
                    e.renderer().avx_active ? "AVX" : "scalar",
                    e.renderer().thread_count);
    } else {
        ImGui::Text("x: %.6f   y: %.6f   zoom: %.4gx   rot: %.1f deg   depth: %d   %.0f ms",
                    cam.center.re, cam.center.im, cam.zoom,
                    cam.rotation * 180.0 / 3.14159265358979323846, e.depth(),
                    e.last_render_ms());
    }
    ImGui::End();
}

// ---------------------------------------------------------------------------
// Keyboard
// ---------------------------------------------------------------------------
struct KeyBinding {
    ImGuiKey imgui;
    Key      key;
};

static const KeyBinding KEY_BINDINGS[] = {
    {ImGuiKey_LeftArrow,      Key::Left},
    {ImGuiKey_RightArrow,     Key::Right},
    {ImGuiKey_UpArrow,        Key::Up},
    {ImGuiKey_DownArrow,      Key::Down},
    {ImGuiKey_A,              Key::A},
    {ImGuiKey_D,              Key::D},
    {ImGuiKey_W,              Key::W},
    {ImGuiKey_S,              Key::S},
    {ImGuiKey_Q,              Key::Q},
    {ImGuiKey_E,              Key::E},
    {ImGuiKey_R,              Key::R},
    {ImGuiKey_Equal,          Key::Equal},
    {ImGuiKey_Minus,          Key::Minus},
    {ImGuiKey_KeypadAdd,      Key::NumpadAdd},
    {ImGuiKey_KeypadSubtract, Key::NumpadSubtract},
};

void handle_keyboard(AppState& app, const ImGuiIO& io)
{
    if (ImGui::IsKeyPressed(ImGuiKey_S, false) && io.KeyCtrl) open_export(app);
    if (ImGui::IsKeyPressed(ImGuiKey_F11, false)) toggle_fullscreen(app);
    if (ImGui::IsKeyPressed(ImGuiKey_F1, false)) app.show_about = true;

    InputController& in = app.engine.input();
    if (io.WantTextInput) {
        in.release_all_keys();
        return;
    }
    for (const auto& b : KEY_BINDINGS) {
        if (ImGui::IsKeyPressed(b.imgui, true) && !(b.key == Key::S && io.KeyCtrl))
            in.key_down(b.key, io.KeyCtrl, !ImGui::IsKeyPressed(b.imgui, false));
        if (ImGui::IsKeyReleased(b.imgui))
            in.key_up(b.key);
    }
}

// ---------------------------------------------------------------------------
// Export dialog
// ---------------------------------------------------------------------------
void draw_export_dialog(AppState& app)
{
    Engine& e = app.engine;

    if (app.show_export) {
        ImGui::OpenPopup("Export Image##dlg");
        app.show_export = false;
    }
    if (!ImGui::BeginPopupModal("Export Image##dlg", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
        return;

    const int base_w = e.framebuffer().width;
    const int base_h = e.framebuffer().height;

    section("FORMAT");
    ImGui::RadioButton("PNG", &app.exp_fmt, static_cast<int>(ImageFormat::Png));
    ImGui::SameLine();
    if (jxl_available())
        ImGui::RadioButton("JPEG XL (lossless)", &app.exp_fmt, static_cast<int>(ImageFormat::Jxl));
    else
        ImGui::TextDisabled("JXL (not available)");
    if (!jxl_available()) app.exp_fmt = static_cast<int>(ImageFormat::Png);

    section("RESOLUTION");
    {
        char buf1[64], buf2[64], buf4[64];
        std::snprintf(buf1, sizeof(buf1), "1x   %d x %d", base_w,     base_h    );
        std::snprintf(buf2, sizeof(buf2), "2x   %d x %d", base_w * 2, base_h * 2);
        std::snprintf(buf4, sizeof(buf4), "4x   %d x %d", base_w * 4, base_h * 4);
        ImGui::RadioButton(buf1, &app.exp_scale, 0);
        ImGui::RadioButton(buf2, &app.exp_scale, 1);
        ImGui::RadioButton(buf4, &app.exp_scale, 2);
        ImGui::RadioButton("Custom", &app.exp_scale, 3);
        if (app.exp_scale == 3) {
            ImGui::SameLine();
            ImGui::SetNextItemWidth(80.0f);
            ImGui::InputInt("##cw", &app.exp_custom_w, 0);
            app.exp_custom_w = std::clamp(app.exp_custom_w, 16, 7680);
            ImGui::SameLine(); ImGui::TextUnformatted("x");
            ImGui::SameLine();
            ImGui::SetNextItemWidth(80.0f);
            ImGui::InputInt("##ch", &app.exp_custom_h, 0);
            app.exp_custom_h = std::clamp(app.exp_custom_h, 16, 4320);
        }
    }

    section("OUTPUT");
    const auto  fmt = static_cast<ImageFormat>(app.exp_fmt);
    const std::string filename =
        std::string(fractal_id(e.fractal())) + "_" + file_timestamp() + image_extension(fmt);
    ImGui::Text("%s", filename.c_str());

    if (!app.exp_done) {
        ImGui::Spacing();
        if (ImGui::Button("Export", ImVec2(120.0f, 0.0f))) {
            app.exp_saved_name = filename;
            int tw, th;
            switch (app.exp_scale) {
                case 0:  tw = base_w;           th = base_h;           break;
                case 1:  tw = base_w * 2;       th = base_h * 2;       break;
                case 2:  tw = base_w * 4;       th = base_h * 4;       break;
                default: tw = app.exp_custom_w; th = app.exp_custom_h; break;
            }
            // Off-screen engine restored from the current session so the
            // export matches the settled view at any resolution.
            EngineOptions opt;
            opt.threads = e.renderer().thread_count;
            opt.initial = e.fractal();
            Engine offscreen(opt);
            offscreen.resize(std::max(1, tw), std::max(1, th));
            offscreen.restore(e.snapshot());
            offscreen.set_render_scale(1.0);
            offscreen.frame(REFERENCE_TICK);
            app.exp_msg  = save_image(app.exp_saved_name, offscreen.capture());
            app.exp_done = true;
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(80.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
    } else {
        ImGui::Spacing();
        if (app.exp_msg.empty())
            ImGui::TextColored(ImVec4(0.3f, 1.0f, 0.3f, 1.0f), "Saved: %s", app.exp_saved_name.c_str());
        else
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "Error: %s", app.exp_msg.c_str());
        ImGui::Spacing();
        if (ImGui::Button("Close", ImVec2(80.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

// ---------------------------------------------------------------------------
// Session save / load
// ---------------------------------------------------------------------------
static void session_popup(AppState& app, const char* id, const char* action, bool save)
{
    if (!ImGui::BeginPopupModal(id, nullptr, ImGuiWindowFlags_AlwaysAutoResize))
        return;

    ImGui::TextDisabled("FILE");
    ImGui::SetNextItemWidth(360.0f);
    ImGui::InputText("##session_path", app.session_path, sizeof(app.session_path));

    if (!app.session_done) {
        ImGui::Spacing();
        if (ImGui::Button(action, ImVec2(120.0f, 0.0f))) {
            if (save) {
                app.session_msg = app.engine.save_session(app.session_path);
            } else {
                app.session_msg = app.engine.load_session(app.session_path);
                if (app.session_msg.empty()) app.failed_kind = -1;
            }
            app.session_done = true;
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(80.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
    } else {
        ImGui::Spacing();
        if (app.session_msg.empty())
            ImGui::TextColored(ImVec4(0.3f, 1.0f, 0.3f, 1.0f), "%s: %s",
                               save ? "Saved" : "Loaded", app.session_path);
        else
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "Error: %s", app.session_msg.c_str());
        ImGui::Spacing();
        if (ImGui::Button("Close", ImVec2(80.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

void draw_session_dialogs(AppState& app)
{
    if (app.show_save) {
        ImGui::OpenPopup("Save Session##dlg");
        app.show_save = false;
    }
    if (app.show_load) {
        ImGui::OpenPopup("Load Session##dlg");
        app.show_load = false;
    }
    session_popup(app, "Save Session##dlg", "Save", true);
    session_popup(app, "Load Session##dlg", "Load", false);
}

// ---------------------------------------------------------------------------
// Benchmark dialog: Mpix/s per thread count, AVX and scalar
// ---------------------------------------------------------------------------
void draw_benchmark_dialog(AppState& app)
{
    constexpr int BENCH_W = 1920, BENCH_H = 1080, BENCH_REPS = 4;

    if (app.show_benchmark) {
        ImGui::SetNextWindowSize(ImVec2(520, 620), ImGuiCond_Always);
        ImGui::OpenPopup("Benchmark##dlg");
        app.show_benchmark = false;
    }
    if (!ImGui::BeginPopupModal("Benchmark##dlg", nullptr, ImGuiWindowFlags_NoResize))
        return;

    BenchState& b  = app.bench;
    const int   hw = app.engine.renderer().hw_concurrency;

    // One render step per frame while running
    if (b.running) {
        CpuRenderer& r = b.engine->renderer();
        r.set_thread_count(b.ti + 1);
        r.set_avx(b.phase == 0);
        b.engine->invalidate();
        b.engine->frame(REFERENCE_TICK);
        b.sum += b.engine->last_render_ms();
        b.rep++;

        if (b.rep == BENCH_REPS) {
            const double avg_ms = std::max(b.sum / BENCH_REPS, 1e-3);
            const float  mpixs  = static_cast<float>(BENCH_W * static_cast<double>(BENCH_H) / (avg_ms * 1000.0));
            if (b.phase == 0) b.avx[b.ti]    = mpixs;
            else              b.scalar[b.ti] = mpixs;
            b.sum = 0.0;
            b.rep = 0;
            b.ti++;
            if (b.ti == hw) {
                b.ti = 0;
                b.phase++;
                if (b.phase == 2) {
                    b.running = false;
                    b.done    = true;
                    b.engine.reset();
                }
            }
        }
    }

    if (!b.running) {
        if (ImGui::Button(b.done ? "Run again" : "Run")) {
            b.avx.assign(hw, 0.0f);
            b.scalar.assign(hw, 0.0f);
            b.phase   = 0;
            b.ti      = 0;
            b.rep     = 0;
            b.sum     = 0.0;
            b.done    = false;
            b.engine  = std::make_unique<Engine>();
            b.engine->resize(BENCH_W, BENCH_H);
            b.running = true;
        }
    } else {
        ImGui::BeginDisabled();
        ImGui::Button("Running...");
        ImGui::EndDisabled();
    }

    if (b.running || b.done) {
        const int total = hw * 2 * BENCH_REPS;
        const int done  = b.phase * hw * BENCH_REPS + b.ti * BENCH_REPS + b.rep;
        ImGui::SameLine();
        char prog[64];
        if (b.running)
            std::snprintf(prog, sizeof(prog), "%s  %d/%d threads  rep %d/%d",
                          b.phase == 0 ? "AVX" : "Scalar", b.ti + 1, hw, b.rep + 1, BENCH_REPS);
        else
            std::snprintf(prog, sizeof(prog), "Done");
        ImGui::TextDisabled("%s", prog);
        ImGui::ProgressBar(static_cast<float>(done) / total, ImVec2(-1.0f, 0.0f));
    }

    if ((b.running && (b.phase > 0 || b.ti > 0)) || b.done) {
        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();

        const ImVec2 plot_sz(ImGui::GetContentRegionAvail().x, 110.0f);
        float y_max = 1.0f;
        for (int i = 0; i < hw; ++i)
            y_max = std::max({y_max, b.avx[i], b.scalar[i]});
        y_max *= 1.1f;

        char avx_lbl[48], scalar_lbl[48];
        std::snprintf(avx_lbl,    sizeof(avx_lbl),    "AVX   (Mpix/s, 1..%d threads)", hw);
        std::snprintf(scalar_lbl, sizeof(scalar_lbl), "Scalar(Mpix/s, 1..%d threads)", hw);

        ImGui::PushStyleColor(ImGuiCol_PlotHistogram, ImVec4(0.3f, 0.7f, 1.0f, 1.0f));
        ImGui::PlotHistogram("##avx", b.avx.data(), hw, 0, avx_lbl, 0.0f, y_max, plot_sz);
        ImGui::PopStyleColor();

        ImGui::PushStyleColor(ImGuiCol_PlotHistogram, ImVec4(1.0f, 0.6f, 0.2f, 1.0f));
        ImGui::PlotHistogram("##scalar", b.scalar.data(), hw, 0, scalar_lbl, 0.0f, y_max, plot_sz);
        ImGui::PopStyleColor();

        ImGui::Spacing();
        ImGui::TextDisabled("1920x1080  Mandelbrot  256 iter  avg 4 runs  hover for exact value");
    }

    ImGui::Spacing();
    ImGui::Separator();
    ImGui::Spacing();
    if (ImGui::Button("Close") || ImGui::IsKeyPressed(ImGuiKey_Escape)) {
        b.running = false;
        b.engine.reset();
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

// ---------------------------------------------------------------------------
// About dialog
// ---------------------------------------------------------------------------
void draw_about_dialog(AppState& app)
{
    if (app.show_about) {
        ImGui::OpenPopup("About##dlg");
        app.show_about = false;
    }
    if (!ImGui::BeginPopupModal("About##dlg", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
        return;

    ImGui::Text("Fractal Studio");
    ImGui::Separator();
    ImGui::Spacing();
    ImGui::Text("Interactive escape-time and recursive geometry fractals.");
    ImGui::Text("Mandelbrot  |  Julia  |  Koch  |  Sierpinski  |  Tree");
    ImGui::Spacing();
    ImGui::TextDisabled("Drag to pan, wheel or pinch to zoom, Q/E to rotate");
    ImGui::TextDisabled("Double-double precision past 20x zoom");
    ImGui::TextDisabled("Adaptive supersampling and escape radius");
    ImGui::TextDisabled("PNG and JPEG XL export, JSON sessions");
    ImGui::Spacing();
    ImGui::Separator();
    ImGui::Spacing();
    ImGui::TextDisabled("Built with Dear ImGui, SDL2, spdlog, libpng, libjxl");
    ImGui::Spacing();
    ImGui::SetCursorPosX((ImGui::GetContentRegionAvail().x - 120.0f) * 0.5f + ImGui::GetCursorPosX());
    if (ImGui::Button("Close", ImVec2(120.0f, 0.0f)))
        ImGui::CloseCurrentPopup();
    ImGui::EndPopup();
}
