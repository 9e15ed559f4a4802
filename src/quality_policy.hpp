#pragma once

#include "complex_math.hpp"
#include "view_state.hpp"

// ---------------------------------------------------------------------------
// Adaptive quality: a pure function of zoom plus the user's settings.
// Iterations are only ever chosen by the user; the policy merely suggests.
// ---------------------------------------------------------------------------
constexpr double COMPENSATED_ZOOM_THRESHOLD = 20.0;
constexpr double DITHER_ZOOM_THRESHOLD      = 5.0;
constexpr double DITHER_AMPLITUDE           = 0.01;
constexpr double RADIUS_BOOST_ZOOM          = 1e4;
constexpr double RADIUS_BOOST_CAP           = 10.0;
constexpr double EXTREME_ZOOM               = 1e6;
constexpr int    MAX_SAMPLE_SIDE            = 16;

// User-owned quality knobs.
struct QualitySettings {
    int           max_iterations = 256;
    double        escape_radius  = 2.0;
    bool          smooth         = true;
    PrecisionMode precision      = PrecisionMode::Auto;
    double        render_scale   = 1.0;
};

struct QualityDecision {
    int    iterations     = 256;
    double escape_radius  = 2.0;
    bool   compensated    = false;
    int    samples        = 1;       // N for an N x N grid
    double dither         = 0.0;
    int    iteration_hint = 0;       // 0: no suggestion
    bool   extreme_zoom   = false;
};

bool   use_compensated(double zoom, PrecisionMode mode);
int    supersample_side(double zoom, double render_scale);
double effective_escape_radius(double base, double zoom);
int    iteration_hint(double zoom, int iterations, double render_scale);

QualityDecision decide_quality(double zoom, const QualitySettings& s);

// Deterministic per-pixel noise in [0, 1).
double jitter_hash(double x, double y, double k);
double jitter_hash2(double x, double y, double k);

// Sub-pixel offset, in pixels relative to the pixel center, of grid cell
// (sx, sy) of an n x n supersample pattern at pixel (px, py).
Vec2 sample_offset(int px, int py, int sx, int sy, int n);

// Per-channel color offset for a pixel; 0 when amplitude is 0.
double dither_offset(int px, int py, double amplitude);
