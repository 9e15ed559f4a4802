#include "viewport.hpp"

#include <algorithm>
#include <cmath>

double damping_alpha(double dt)
{
    if (!(dt > 0.0)) return ANIMATION_SPEED;
    return 1.0 - std::pow(1.0 - ANIMATION_SPEED, dt / REFERENCE_TICK);
}

static double approach(double live, double target, double alpha)
{
    const double d = target - live;
    if (std::abs(d) <= SETTLE_EPSILON)
        return target;
    // Near large targets the step can fall below one ulp of `live`.
    const double next = live + d * alpha;
    return (next == live && alpha > 0.0) ? target : next;
}

ViewCamera step_camera(const ViewCamera& live, const ViewCamera& target, double alpha)
{
    alpha = std::clamp(alpha, 0.0, 1.0);
    ViewCamera next;
    next.center.re = approach(live.center.re, target.center.re, alpha);
    next.center.im = approach(live.center.im, target.center.im, alpha);
    next.zoom      = approach(live.zoom,      target.zoom,      alpha);
    next.rotation  = approach(live.rotation,  target.rotation,  alpha);
    return next;
}

bool cameras_equal(const ViewCamera& a, const ViewCamera& b)
{
    return a.center.re == b.center.re && a.center.im == b.center.im &&
           a.zoom == b.zoom && a.rotation == b.rotation;
}

// ---------------------------------------------------------------------------
// Viewport
// ---------------------------------------------------------------------------
void Viewport::set_target(Complex center, double zoom, double rotation)
{
    if (!is_finite(center) || !std::isfinite(zoom) || !std::isfinite(rotation))
        return;
    target_cam.center   = center;
    target_cam.zoom     = std::max(MIN_ZOOM, zoom);
    target_cam.rotation = rotation;
}

bool Viewport::advance(double dt)
{
    if (settled()) return false;
    live_cam = step_camera(live_cam, target_cam, damping_alpha(dt));
    return !settled();
}

void Viewport::pan(double dx, double dy, double w, double h)
{
    if (w <= 0.0 || h <= 0.0) return;
    const double aspect = w / h;
    const double range  = 4.0 / live_cam.zoom;

    Complex delta{-(dx / w) * range * aspect, (dy / h) * range};
    if (live_cam.rotation != 0.0)
        delta = ::rotate(delta, -live_cam.rotation);

    set_target(add(target_cam.center, delta), target_cam.zoom, target_cam.rotation);
}

void Viewport::zoom_at(double factor, double sx, double sy, double w, double h)
{
    if (w <= 0.0 || h <= 0.0 || !(factor > 0.0) || !std::isfinite(factor)) return;

    const Complex point    = screen_to_plane(sx, sy, w, h, target_cam);
    const double  new_zoom = std::max(MIN_ZOOM, target_cam.zoom * factor);
    // Effective factor after the zoom floor so the point stays put.
    const double  f        = new_zoom / target_cam.zoom;
    const Complex offset   = sub(point, target_cam.center);
    const Complex center{point.re - offset.re / f, point.im - offset.im / f};

    set_target(center, new_zoom, target_cam.rotation);
}

void Viewport::jump_to(const ViewCamera& cam)
{
    set_target(cam.center, cam.zoom, cam.rotation);
    live_cam = target_cam;
}

ShaderParams Viewport::shader_params(double w, double h) const
{
    ShaderParams p;
    p.center   = live_cam.center;
    p.zoom     = live_cam.zoom;
    p.rotation = live_cam.rotation;
    p.aspect   = h > 0.0 ? w / h : 1.0;
    p.range    = 4.0 / live_cam.zoom;
    return p;
}
