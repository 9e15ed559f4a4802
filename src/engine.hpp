#pragma once

#include "cpu_renderer.hpp"
#include "fractal.hpp"
#include "input_controller.hpp"
#include "pixel_buffer.hpp"
#include "quality_policy.hpp"
#include "session.hpp"
#include "stats.hpp"
#include "viewport.hpp"

#include <array>
#include <functional>
#include <string>
#include <vector>

constexpr double MAX_ZOOM          = 1e15;   // soft limit for setters and the frame step
constexpr double MIN_ESCAPE_RADIUS = 1.0;
constexpr double MAX_ESCAPE_RADIUS = 1000.0;
constexpr double MIN_RENDER_SCALE  = 0.5;
constexpr double MAX_RENDER_SCALE  = 2.0;
constexpr int    STATS_INTERVAL    = 60;     // frames between statistics refreshes

struct EngineOptions {
    int         threads = 0;                 // 0: hardware concurrency
    FractalKind initial = FractalKind::Mandelbrot;
    // Extra per-kind setup run inside the guarded initialization; throwing
    // marks that kind unavailable.
    std::function<void(FractalKind)> init_hook;
};

// ---------------------------------------------------------------------------
// Owns the viewport, input controller, per-fractal parameters, quality
// settings, renderer and framebuffer. One instance per window; the GUI and
// the headless modes get it by reference.
//
// Every setter clamps silently and returns the value actually stored.
// Non-finite input is rejected and the previous value kept.
// ---------------------------------------------------------------------------
class Engine {
public:
    explicit Engine(const EngineOptions& opt = {});

    Viewport&        viewport()       { return view; }
    InputController& input()          { return controller; }
    CpuRenderer&     renderer()       { return cpu; }

    // Surface size in window units; the framebuffer is that times dpr and
    // the render scale, rounded, at least 1x1.
    void resize(int width, int height, double device_pixel_ratio = 1.0);
    int  surface_width()  const { return surface_w; }
    int  surface_height() const { return surface_h; }

    // False (and logged) for a kind whose initialization failed.
    bool set_fractal(FractalKind kind);
    FractalKind          fractal() const { return active; }
    const FractalParams& params()  const { return stored[static_cast<size_t>(active)]; }

    bool        available(FractalKind kind) const { return init_errors[static_cast<size_t>(kind)].empty(); }
    const std::string& init_error(FractalKind kind) const { return init_errors[static_cast<size_t>(kind)]; }

    // Input poll, animation step, quality derivation, render, statistics.
    // Returns true if the framebuffer changed.
    bool frame(double dt);
    void invalidate() { dirty = true; }

    // --- Parameters --------------------------------------------------------
    int    max_iterations() const { return quality_settings.max_iterations; }
    int    set_max_iterations(int n);

    double escape_radius() const { return quality_settings.escape_radius; }
    double set_escape_radius(double r);

    bool   smooth() const { return quality_settings.smooth; }
    bool   set_smooth(bool on);

    PrecisionMode precision_mode() const { return quality_settings.precision; }
    PrecisionMode set_precision_mode(PrecisionMode m);

    double render_scale() const { return quality_settings.render_scale; }
    double set_render_scale(double s);

    int    color_scheme() const { return schemes[static_cast<size_t>(active)]; }
    int    set_color_scheme(int scheme);

    // Viewport target values.
    Complex center() const   { return view.target().center; }
    Complex set_center(Complex c);
    double  zoom() const     { return view.target().zoom; }
    double  set_zoom(double z);
    double  rotation() const { return view.target().rotation; }
    double  set_rotation(double r);
    void    reset_view();

    Complex julia_constant() const;
    Complex set_julia_constant(Complex c);

    // Recursion depth of the active geometric fractal; -1 for escape-time.
    int    depth() const { return recursion_depth(params()); }
    int    set_depth(int d);

    double branch_angle() const;
    double set_branch_angle(double degrees);
    double length_ratio() const;
    double set_length_ratio(double ratio);

    // --- Presets -----------------------------------------------------------
    bool apply_julia_preset(const std::string& name);
    bool apply_point_of_interest(const std::string& name);

    // Mandelbrot only: the plane point under (x, y) becomes the Julia
    // constant and the view switches to Julia.
    bool julia_from_screen_point(double x, double y);

    // Plane point under a surface position, as currently rendered.
    Complex plane_point(double x, double y) const;

    // --- Session -----------------------------------------------------------
    SessionSnapshot snapshot() const;
    void            restore(const SessionSnapshot& snap);
    std::string     save_session(const std::string& path) const;
    std::string     load_session(const std::string& path);

    // --- Output ------------------------------------------------------------
    const PixelBuffer&     framebuffer() const { return buffer; }
    PixelBuffer            capture()     const { return buffer; }
    const FractalStats&    statistics()  const { return stats; }
    const QualityDecision& quality()     const { return decision; }
    int                    iteration_hint() const { return decision.iteration_hint; }
    bool                   extreme_zoom()   const { return decision.extreme_zoom; }
    double                 last_render_ms() const { return cpu.last_render_ms; }
    void                   refresh_statistics() { stats_pending = true; }

    // Geometry of the active fractal (empty for escape-time kinds).
    const std::vector<Segment>&  segments()  const { return segs; }
    const std::vector<Triangle>& triangles() const { return tris; }

private:
    void init_fractals(const EngineOptions& opt);
    void regenerate_geometry();
    void apply_surface();
    bool validate_camera();
    RenderParams derive_params() const;
    FractalParams& active_params() { return stored[static_cast<size_t>(active)]; }
    void log_zoom_changes();

    Viewport        view;
    InputController controller;
    CpuRenderer     cpu;

    FractalKind active = FractalKind::Mandelbrot;
    std::array<FractalParams, FRACTAL_KIND_COUNT> stored;
    std::array<int,           FRACTAL_KIND_COUNT> schemes{};
    std::array<std::string,   FRACTAL_KIND_COUNT> init_errors;

    QualitySettings quality_settings;
    QualityDecision decision;

    int    surface_w = 0;
    int    surface_h = 0;
    double dpr       = 1.0;

    PixelBuffer           buffer;
    Coverage              coverage;
    std::vector<Segment>  segs;
    std::vector<Triangle> tris;

    FractalStats stats;
    bool         stats_pending = true;
    long long    frame_count   = 0;

    // What the framebuffer currently shows.
    bool         dirty = true;
    ViewCamera   rendered_camera;
    ViewCamera   last_valid_camera;
    bool         last_compensated = false;
    int          last_decade      = 0;
};
