#include "quality_policy.hpp"
#include "escape_time.hpp"

#include <algorithm>
#include <cmath>

bool use_compensated(double zoom, PrecisionMode mode)
{
    switch (mode) {
        case PrecisionMode::Standard:    return false;
        case PrecisionMode::Compensated: return true;
        case PrecisionMode::Auto:        break;
    }
    return zoom > COMPENSATED_ZOOM_THRESHOLD;
}

int supersample_side(double zoom, double render_scale)
{
    int n = 1;
    if      (zoom > 1e5) n = 12;
    else if (zoom > 1e4) n = 8;
    else if (zoom > 1e3) n = 6;
    else if (zoom > 1e2) n = 4;

    const double mult = std::max(1.0, render_scale * 0.5);
    n = static_cast<int>(std::floor(n * mult));
    return std::clamp(n, 1, MAX_SAMPLE_SIDE);
}

double effective_escape_radius(double base, double zoom)
{
    if (zoom > RADIUS_BOOST_ZOOM && base < RADIUS_BOOST_CAP)
        return std::min(base * 1.5, RADIUS_BOOST_CAP);
    return base;
}

int iteration_hint(double zoom, int iterations, double render_scale)
{
    if (zoom <= 100.0 || iterations >= zoom / 50.0) return 0;

    double k = 0.8;
    if      (zoom < 1e3) k = 3.0;
    else if (zoom < 1e4) k = 1.5;

    const double hint = std::min(zoom * k * render_scale, static_cast<double>(MAX_ITERATIONS_CAP));
    return std::max(1, static_cast<int>(hint));
}

QualityDecision decide_quality(double zoom, const QualitySettings& s)
{
    QualityDecision d;
    d.iterations     = clamp_iterations(s.max_iterations);
    d.escape_radius  = effective_escape_radius(s.escape_radius, zoom);
    d.compensated    = use_compensated(zoom, s.precision);
    d.samples        = supersample_side(zoom, s.render_scale);
    d.dither         = zoom > DITHER_ZOOM_THRESHOLD ? DITHER_AMPLITUDE : 0.0;
    d.iteration_hint = iteration_hint(zoom, d.iterations, s.render_scale);
    d.extreme_zoom   = zoom > EXTREME_ZOOM;
    return d;
}

// ---------------------------------------------------------------------------
// Hashes
// ---------------------------------------------------------------------------
static double fract(double v) { return v - std::floor(v); }

double jitter_hash(double x, double y, double k)
{
    return fract(std::sin(x * 12.9898 + y * 78.233 + k * 7.234) * 43758.5453);
}

double jitter_hash2(double x, double y, double k)
{
    return fract(std::sin(x * 93.9898 + y * 17.233 + k * 3.456) * 43758.5453);
}

Vec2 sample_offset(int px, int py, int sx, int sy, int n)
{
    if (n <= 1) return {0.0, 0.0};
    const double inv = 1.0 / n;
    const double jx  = (jitter_hash (px, py, sx) - 0.5) * 0.2 * inv;
    const double jy  = (jitter_hash2(px, py, sy) - 0.5) * 0.2 * inv;
    return {sx * inv - 0.5 + jx, sy * inv - 0.5 + jy};
}

double dither_offset(int px, int py, double amplitude)
{
    if (amplitude == 0.0) return 0.0;
    return (jitter_hash(px, py, 0.0) - 0.5) * amplitude;
}
