#include "engine.hpp"
#include "escape_time.hpp"
#include "log.hpp"
#include "palette.hpp"
#include "presets.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

bool precision_from_name(const std::string& name, PrecisionMode& out)
{
    for (int i = 0; i < PRECISION_MODE_COUNT; ++i) {
        const auto m = static_cast<PrecisionMode>(i);
        if (name == precision_name(m)) {
            out = m;
            return true;
        }
    }
    return false;
}

// Finite double from a snapshot, narrowed to int without overflow.
int to_int(double v)
{
    return static_cast<int>(std::lround(std::clamp(v, -1e9, 1e9)));
}

}  // namespace

// -----------------------------------------------------------------------
// Construction: every fractal kind is initialized once, in isolation
// -----------------------------------------------------------------------
Engine::Engine(const EngineOptions& opt)
    : controller(view)
{
    for (int i = 0; i < FRACTAL_KIND_COUNT; ++i)
        stored[static_cast<size_t>(i)] = default_params(static_cast<FractalKind>(i));

    if (opt.threads > 0) cpu.set_thread_count(opt.threads);

    init_fractals(opt);

    active = opt.initial;
    if (!available(active)) {
        for (int i = 0; i < FRACTAL_KIND_COUNT; ++i) {
            if (available(static_cast<FractalKind>(i))) {
                active = static_cast<FractalKind>(i);
                break;
            }
        }
    }

    controller.set_fractal(active);
    view.jump_to({default_center(active), 1.0, 0.0});
    last_valid_camera = view.live();
    last_compensated  = use_compensated(view.live().zoom, quality_settings.precision);
    last_decade       = static_cast<int>(std::floor(std::log10(view.live().zoom)));
    regenerate_geometry();
}

void Engine::init_fractals(const EngineOptions& opt)
{
    for (int i = 0; i < FRACTAL_KIND_COUNT; ++i) {
        const auto kind = static_cast<FractalKind>(i);
        try {
            if (palette_count(kind) <= 0)
                throw std::runtime_error("no color schemes");

            const FractalParams& p = stored[static_cast<size_t>(i)];
            switch (kind) {
                case FractalKind::Mandelbrot:
                case FractalKind::Julia: {
                    const EscapeResult probe = evaluate_point(kind, Complex{}, Complex{},
                                                              JuliaParams{}.c, 16, 2.0, false);
                    if (probe.iterations < 0)
                        throw std::runtime_error("evaluator self-check failed");
                    break;
                }
                case FractalKind::Koch:
                    if (generate_koch(recursion_depth(p)).empty())
                        throw std::runtime_error("empty geometry");
                    break;
                case FractalKind::Sierpinski:
                    if (generate_sierpinski(recursion_depth(p)).empty())
                        throw std::runtime_error("empty geometry");
                    break;
                case FractalKind::Tree:
                    if (generate_tree(std::get<TreeParams>(p).shape).empty())
                        throw std::runtime_error("empty geometry");
                    break;
            }

            if (opt.init_hook) opt.init_hook(kind);
        } catch (const std::exception& e) {
            std::string msg = e.what();
            if (msg.empty()) msg = "initialization failed";
            init_errors[static_cast<size_t>(i)] = msg;
            fractal_log().error("Failed to initialize {}: {}", fractal_name(kind), msg);
        }
    }
}

void Engine::regenerate_geometry()
{
    segs.clear();
    tris.clear();

    const FractalParams& p = params();
    switch (active) {
        case FractalKind::Koch:       segs = generate_koch(recursion_depth(p));            break;
        case FractalKind::Sierpinski: tris = generate_sierpinski(recursion_depth(p));      break;
        case FractalKind::Tree:       segs = generate_tree(std::get<TreeParams>(p).shape); break;
        default: break;
    }
    dirty         = true;
    stats_pending = true;
}

// -----------------------------------------------------------------------
// Surface
// -----------------------------------------------------------------------
void Engine::resize(int width, int height, double device_pixel_ratio)
{
    if (width <= 0 || height <= 0) return;
    surface_w = width;
    surface_h = height;
    dpr       = (std::isfinite(device_pixel_ratio) && device_pixel_ratio > 0.0)
                    ? device_pixel_ratio : 1.0;
    controller.set_surface(width, height);
    apply_surface();
}

void Engine::apply_surface()
{
    if (surface_w <= 0 || surface_h <= 0) return;

    const double k  = dpr * quality_settings.render_scale;
    const int    fw = std::max(1, static_cast<int>(std::lround(surface_w * k)));
    const int    fh = std::max(1, static_cast<int>(std::lround(surface_h * k)));
    if (fw == buffer.width && fh == buffer.height) return;

    buffer.resize(fw, fh);
    coverage.resize(fw, fh);
    dirty         = true;
    stats_pending = true;
    fractal_log().debug("Framebuffer resized to {}x{} (surface {}x{}, dpr {}, scale {})",
                        fw, fh, surface_w, surface_h, dpr, quality_settings.render_scale);
}

// -----------------------------------------------------------------------
// Fractal selection
// -----------------------------------------------------------------------
bool Engine::set_fractal(FractalKind kind)
{
    if (!available(kind)) {
        fractal_log().error("{} is unavailable: {}", fractal_name(kind), init_error(kind));
        return false;
    }

    active = kind;
    controller.set_fractal(kind);
    view.set_target(default_center(kind), 1.0, 0.0);
    regenerate_geometry();
    fractal_log().info("Switched to {} fractal", fractal_name(kind));
    return true;
}

// -----------------------------------------------------------------------
// Frame pipeline
// -----------------------------------------------------------------------
bool Engine::validate_camera()
{
    const ViewCamera& live = view.live();
    const ViewCamera& tgt  = view.target();
    const bool ok = is_finite(live.center) && std::isfinite(live.zoom) && live.zoom > 0.0 &&
                    std::isfinite(live.rotation) &&
                    is_finite(tgt.center) && std::isfinite(tgt.zoom) && tgt.zoom > 0.0 &&
                    std::isfinite(tgt.rotation);
    if (!ok) {
        fractal_log().warn("Rejected invalid viewport state, restoring last valid view");
        view.jump_to(last_valid_camera);
        return false;
    }
    if (tgt.zoom > MAX_ZOOM)
        view.set_target(tgt.center, MAX_ZOOM, tgt.rotation);

    last_valid_camera = view.live();
    return true;
}

void Engine::log_zoom_changes()
{
    const double zoom = view.live().zoom;
    if (decision.compensated != last_compensated) {
        fractal_log().debug("Precision switched to {} at zoom {:.3g}",
                            decision.compensated ? "compensated" : "standard", zoom);
        last_compensated = decision.compensated;
    }
    const int decade = static_cast<int>(std::floor(std::log10(zoom)));
    if (decade != last_decade) {
        fractal_log().debug("Zoom {:.3g}x (samples {}x{}, radius {})",
                            zoom, decision.samples, decision.samples, decision.escape_radius);
        last_decade = decade;
    }
}

RenderParams Engine::derive_params() const
{
    RenderParams rp;
    rp.kind          = active;
    rp.width         = buffer.width;
    rp.height        = buffer.height;
    rp.camera        = view.live();
    rp.max_iter      = decision.iterations;
    rp.escape_radius = decision.escape_radius;
    rp.compensated   = decision.compensated;
    rp.samples       = decision.samples;
    rp.smooth        = quality_settings.smooth;
    rp.dither        = decision.dither;
    rp.julia_c       = julia_constant();
    rp.scheme        = color_scheme();
    return rp;
}

bool Engine::frame(double dt)
{
    ++frame_count;
    if (buffer.empty() || !available(active)) return false;

    // 1. held keys, 2. animation, 3. validation and quality
    controller.poll();
    view.advance(dt);
    validate_camera();
    decision = decide_quality(view.live().zoom, quality_settings);
    log_zoom_changes();

    // 4. render, skipped when nothing changed
    const bool changed = dirty || !cameras_equal(view.live(), rendered_camera);
    if (changed) {
        const RenderParams rp = derive_params();
        if (is_escape_time(active))
            cpu.render(rp, buffer, coverage);
        else
            cpu.render_geometry(rp, segs, tris, buffer);
        rendered_camera = rp.camera;
        dirty = false;
    }

    // 5. statistics
    if (stats_pending || frame_count % STATS_INTERVAL == 0) {
        stats = compute_statistics(params(), coverage, cpu.last_render_ms);
        stats_pending = false;
    }
    return changed;
}

// -----------------------------------------------------------------------
// Quality setters
// -----------------------------------------------------------------------
int Engine::set_max_iterations(int n)
{
    const int v = clamp_iterations(n);
    if (v != n) fractal_log().warn("Iterations {} clamped to {}", n, v);
    if (v != quality_settings.max_iterations) {
        quality_settings.max_iterations = v;
        dirty = stats_pending = true;
    }
    return v;
}

double Engine::set_escape_radius(double r)
{
    if (!std::isfinite(r)) {
        fractal_log().warn("Rejected non-finite escape radius");
        return quality_settings.escape_radius;
    }
    const double v = std::clamp(r, MIN_ESCAPE_RADIUS, MAX_ESCAPE_RADIUS);
    if (v != r) fractal_log().warn("Escape radius {} clamped to {}", r, v);
    if (v != quality_settings.escape_radius) {
        quality_settings.escape_radius = v;
        dirty = stats_pending = true;
    }
    return v;
}

bool Engine::set_smooth(bool on)
{
    if (on != quality_settings.smooth) {
        quality_settings.smooth = on;
        dirty = true;
    }
    return on;
}

PrecisionMode Engine::set_precision_mode(PrecisionMode m)
{
    if (m != quality_settings.precision) {
        quality_settings.precision = m;
        dirty = true;
    }
    return m;
}

double Engine::set_render_scale(double s)
{
    if (!std::isfinite(s)) {
        fractal_log().warn("Rejected non-finite render scale");
        return quality_settings.render_scale;
    }
    const double v = std::clamp(s, MIN_RENDER_SCALE, MAX_RENDER_SCALE);
    if (v != s) fractal_log().warn("Render scale {} clamped to {}", s, v);
    if (v != quality_settings.render_scale) {
        quality_settings.render_scale = v;
        dirty = stats_pending = true;
        apply_surface();
    }
    return v;
}

int Engine::set_color_scheme(int scheme)
{
    const int v = wrap_scheme(active, scheme);
    if (v != schemes[static_cast<size_t>(active)]) {
        schemes[static_cast<size_t>(active)] = v;
        dirty = true;
    }
    return v;
}

// -----------------------------------------------------------------------
// Viewport setters (targets; the frame step animates toward them)
// -----------------------------------------------------------------------
Complex Engine::set_center(Complex c)
{
    if (!is_finite(c)) {
        fractal_log().warn("Rejected non-finite center");
        return center();
    }
    const ViewCamera& t = view.target();
    view.set_target(c, t.zoom, t.rotation);
    return center();
}

double Engine::set_zoom(double z)
{
    if (!std::isfinite(z)) {
        fractal_log().warn("Rejected non-finite zoom");
        return zoom();
    }
    const double v = std::clamp(z, MIN_ZOOM, MAX_ZOOM);
    if (v != z) fractal_log().warn("Zoom {} clamped to {}", z, v);
    const ViewCamera& t = view.target();
    view.set_target(t.center, v, t.rotation);
    return zoom();
}

double Engine::set_rotation(double r)
{
    if (!std::isfinite(r)) {
        fractal_log().warn("Rejected non-finite rotation");
        return rotation();
    }
    const ViewCamera& t = view.target();
    view.set_target(t.center, t.zoom, r);
    return rotation();
}

void Engine::reset_view()
{
    view.reset(default_center(active));
}

// -----------------------------------------------------------------------
// Fractal parameter setters
// -----------------------------------------------------------------------
Complex Engine::julia_constant() const
{
    return std::get<JuliaParams>(stored[static_cast<size_t>(FractalKind::Julia)]).c;
}

Complex Engine::set_julia_constant(Complex c)
{
    if (!is_finite(c)) {
        fractal_log().warn("Rejected non-finite Julia constant");
        return julia_constant();
    }
    FractalParams& slot = stored[static_cast<size_t>(FractalKind::Julia)];
    const FractalParams v = validate_params(JuliaParams{c});
    const Complex stored_c = std::get<JuliaParams>(v).c;
    if (stored_c.re != c.re || stored_c.im != c.im)
        fractal_log().warn("Julia constant clamped to ({}, {})", stored_c.re, stored_c.im);
    slot = v;
    if (active == FractalKind::Julia) dirty = stats_pending = true;
    return stored_c;
}

int Engine::set_depth(int d)
{
    if (is_escape_time(active)) return -1;
    const int before = depth();
    const int v = set_recursion_depth(active_params(), d);
    if (v != d) fractal_log().warn("Recursion depth {} clamped to {}", d, v);
    if (v != before) regenerate_geometry();
    return v;
}

double Engine::branch_angle() const
{
    return std::get<TreeParams>(stored[static_cast<size_t>(FractalKind::Tree)]).shape.branch_angle;
}

double Engine::length_ratio() const
{
    return std::get<TreeParams>(stored[static_cast<size_t>(FractalKind::Tree)]).shape.length_ratio;
}

double Engine::set_branch_angle(double degrees)
{
    if (!std::isfinite(degrees)) {
        fractal_log().warn("Rejected non-finite branch angle");
        return branch_angle();
    }
    TreeShape& shape = std::get<TreeParams>(stored[static_cast<size_t>(FractalKind::Tree)]).shape;
    const double v = std::clamp(degrees, TREE_MIN_ANGLE, TREE_MAX_ANGLE);
    if (v != degrees) fractal_log().warn("Branch angle {} clamped to {}", degrees, v);
    if (v != shape.branch_angle) {
        shape.branch_angle = v;
        if (active == FractalKind::Tree) regenerate_geometry();
    }
    return v;
}

double Engine::set_length_ratio(double ratio)
{
    if (!std::isfinite(ratio)) {
        fractal_log().warn("Rejected non-finite length ratio");
        return length_ratio();
    }
    TreeShape& shape = std::get<TreeParams>(stored[static_cast<size_t>(FractalKind::Tree)]).shape;
    const double v = std::clamp(ratio, TREE_MIN_RATIO, TREE_MAX_RATIO);
    if (v != ratio) fractal_log().warn("Length ratio {} clamped to {}", ratio, v);
    if (v != shape.length_ratio) {
        shape.length_ratio = v;
        if (active == FractalKind::Tree) regenerate_geometry();
    }
    return v;
}

// -----------------------------------------------------------------------
// Presets
// -----------------------------------------------------------------------
bool Engine::apply_julia_preset(const std::string& name)
{
    const JuliaPreset* p = find_julia_preset(name);
    if (!p) {
        fractal_log().warn("Unknown Julia preset '{}'", name);
        return false;
    }
    if (!available(FractalKind::Julia)) return false;

    set_julia_constant(p->c);
    if (active != FractalKind::Julia)
        set_fractal(FractalKind::Julia);
    else
        view.set_target({0.0, 0.0}, 1.0, 0.0);
    fractal_log().info("Applied Julia preset '{}' (c = {} {:+}i)", p->name, p->c.re, p->c.im);
    return true;
}

bool Engine::apply_point_of_interest(const std::string& name)
{
    const PointOfInterest* p = find_point_of_interest(name);
    if (!p) {
        fractal_log().warn("Unknown point of interest '{}'", name);
        return false;
    }
    if (active != FractalKind::Mandelbrot && !set_fractal(FractalKind::Mandelbrot))
        return false;

    view.set_target(p->center, p->zoom, 0.0);
    fractal_log().info("Moving to '{}' at zoom {}", p->name, p->zoom);
    return true;
}

Complex Engine::plane_point(double x, double y) const
{
    if (surface_w <= 0 || surface_h <= 0) return view.live().center;
    return screen_to_plane(x, y, surface_w, surface_h, view.live());
}

bool Engine::julia_from_screen_point(double x, double y)
{
    if (active != FractalKind::Mandelbrot || !available(FractalKind::Julia)) return false;
    const Complex c = set_julia_constant(plane_point(x, y));
    set_fractal(FractalKind::Julia);
    fractal_log().info("Julia constant taken from Mandelbrot point ({}, {})", c.re, c.im);
    return true;
}

// -----------------------------------------------------------------------
// Session
// -----------------------------------------------------------------------
SessionSnapshot Engine::snapshot() const
{
    const ViewCamera& t = view.target();
    const Complex     c = julia_constant();

    SessionSnapshot s;
    s.set("fractal",        std::string(fractal_id(active)));
    s.set("timestamp",      utc_timestamp());
    s.set("center_re",      t.center.re);
    s.set("center_im",      t.center.im);
    s.set("zoom",           t.zoom);
    s.set("rotation",       t.rotation);
    s.set("max_iterations", static_cast<double>(quality_settings.max_iterations));
    s.set("escape_radius",  quality_settings.escape_radius);
    s.set("smooth",         quality_settings.smooth);
    s.set("color_scheme",   static_cast<double>(color_scheme()));
    s.set("precision_mode", std::string(precision_name(quality_settings.precision)));
    s.set("render_scale",   quality_settings.render_scale);
    s.set("julia_re",       c.re);
    s.set("julia_im",       c.im);
    if (!is_escape_time(active))
        s.set("depth",      static_cast<double>(depth()));
    s.set("branch_angle",   branch_angle());
    s.set("length_ratio",   length_ratio());
    return s;
}

void Engine::restore(const SessionSnapshot& snap)
{
    std::string str;
    double      v = 0.0;
    bool        b = false;

    if (snap.get("fractal", str)) {
        FractalKind kind;
        if (!fractal_from_id(str.c_str(), kind))
            fractal_log().warn("Session names unknown fractal '{}'", str);
        else
            set_fractal(kind);
    }

    if (snap.get("max_iterations", v) && std::isfinite(v)) set_max_iterations(to_int(v));
    if (snap.get("escape_radius", v))                      set_escape_radius(v);
    if (snap.get("smooth", b))                             set_smooth(b);
    if (snap.get("color_scheme", v) && std::isfinite(v))   set_color_scheme(to_int(v));
    if (snap.get("render_scale", v))                       set_render_scale(v);
    if (snap.get("precision_mode", str)) {
        PrecisionMode m;
        if (precision_from_name(str, m)) set_precision_mode(m);
        else fractal_log().warn("Session names unknown precision mode '{}'", str);
    }

    Complex c = julia_constant();
    const bool has_re = snap.get("julia_re", c.re);
    const bool has_im = snap.get("julia_im", c.im);
    if (has_re || has_im) set_julia_constant(c);

    if (snap.get("branch_angle", v))                set_branch_angle(v);
    if (snap.get("length_ratio", v))                set_length_ratio(v);
    if (snap.get("depth", v) && std::isfinite(v))   set_depth(to_int(v));

    ViewCamera cam = view.target();
    snap.get("center_re", cam.center.re);
    snap.get("center_im", cam.center.im);
    snap.get("zoom",      cam.zoom);
    snap.get("rotation",  cam.rotation);
    if (is_finite(cam.center) && std::isfinite(cam.zoom) && std::isfinite(cam.rotation)) {
        cam.zoom = std::clamp(cam.zoom, MIN_ZOOM, MAX_ZOOM);
        view.jump_to(cam);
    } else {
        fractal_log().warn("Session viewport is not finite, keeping current view");
    }

    dirty = stats_pending = true;
}

std::string Engine::save_session(const std::string& path) const
{
    const std::string err = write_session_file(path, snapshot());
    if (err.empty())
        fractal_log().info("Session saved to {}", path);
    else
        fractal_log().error("Session save failed: {}", err);
    return err;
}

std::string Engine::load_session(const std::string& path)
{
    SessionSnapshot snap;
    const std::string err = read_session_file(path, snap);
    if (!err.empty()) {
        fractal_log().error("Session load failed: {}", err);
        return err;
    }
    restore(snap);
    fractal_log().info("Session loaded from {}", path);
    return {};
}
