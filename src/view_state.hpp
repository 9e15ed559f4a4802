#pragma once

#include "complex_math.hpp"

enum class FractalKind {
    Mandelbrot = 0,  // z^2 + c, z0 = 0, c = pixel
    Julia      = 1,  // z^2 + c, z0 = pixel, c = constant
    Koch       = 2,  // snowflake, 3 * 4^d segments
    Sierpinski = 3,  // 3^d filled triangles
    Tree       = 4,  // binary tree, 2^(d+1) - 1 segments
};
constexpr int FRACTAL_KIND_COUNT = 5;

enum class PrecisionMode {
    Auto        = 0,  // compensated above the zoom threshold
    Standard    = 1,  // always native double
    Compensated = 2,  // always double-double
};
constexpr int PRECISION_MODE_COUNT = 3;

inline bool is_escape_time(FractalKind k)
{
    return k == FractalKind::Mandelbrot || k == FractalKind::Julia;
}

inline const char* fractal_name(FractalKind k)
{
    switch (k) {
        case FractalKind::Mandelbrot: return "Mandelbrot";
        case FractalKind::Julia:      return "Julia";
        case FractalKind::Koch:       return "Koch Curve";
        case FractalKind::Sierpinski: return "Sierpinski";
        case FractalKind::Tree:       return "Fractal Tree";
    }
    return "Unknown";
}

// Short identifier used on the command line and in saved sessions.
inline const char* fractal_id(FractalKind k)
{
    switch (k) {
        case FractalKind::Mandelbrot: return "mandelbrot";
        case FractalKind::Julia:      return "julia";
        case FractalKind::Koch:       return "koch-curve";
        case FractalKind::Sierpinski: return "sierpinski";
        case FractalKind::Tree:       return "fractal-tree";
    }
    return "unknown";
}

// Returns false and leaves `out` untouched for an unknown id.
bool fractal_from_id(const char* id, FractalKind& out);

// Plane point the view is centered on after a reset.
inline Complex default_center(FractalKind k)
{
    return k == FractalKind::Mandelbrot ? Complex{-0.5, 0.0} : Complex{0.0, 0.0};
}

inline const char* precision_name(PrecisionMode m)
{
    switch (m) {
        case PrecisionMode::Auto:        return "auto";
        case PrecisionMode::Standard:    return "standard";
        case PrecisionMode::Compensated: return "compensated";
    }
    return "auto";
}

// ---------------------------------------------------------------------------
// Everything one frame of rendering needs. Derived every frame from the
// Viewport, the user settings and the quality policy; never stored.
// ---------------------------------------------------------------------------
struct RenderParams {
    FractalKind kind          = FractalKind::Mandelbrot;
    int         width         = 0;
    int         height        = 0;
    ViewCamera  camera;
    int         max_iter      = 256;
    double      escape_radius = 2.0;
    bool        compensated   = false;   // double-double evaluation
    int         samples       = 1;       // supersample grid side (N x N)
    bool        smooth        = true;
    double      dither        = 0.0;     // per-channel color jitter amplitude
    Complex     julia_c       {-0.7, 0.27015};
    int         scheme        = 0;
};
