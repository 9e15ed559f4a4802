#pragma once

#include "view_state.hpp"

#include <cstdint>

// Linear RGB in [0, 1].
struct Rgb {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

// h in degrees [0, 360), s and v in [0, 1].
Rgb hsv_to_rgb(double h, double s, double v);

Rgb mix(Rgb a, Rgb b, float t);

// Piecewise-linear blend over n stops spaced at equal widths; t clamped to [0, 1].
Rgb gradient(const Rgb* stops, int n, double t);

int         palette_count(FractalKind kind);
const char* palette_name(FractalKind kind, int scheme);

// Wraps any integer into [0, palette_count(kind)).
int wrap_scheme(FractalKind kind, int scheme);

// Escape-time color. `iter` is the (smooth) escape count; anything at or
// past max_iter is inside the set and comes back pure black.
Rgb escape_color(double iter, int max_iter, FractalKind kind, int scheme);

// Depth-based color for the recursive geometry fractals.
Rgb geometry_color(FractalKind kind, int scheme, int depth);

// Pixel layout: 0xAABBGGRR, i.e. bytes [R, G, B, A] on little-endian hosts.
inline uint32_t pack_rgba(Rgb c)
{
    auto q = [](float v) -> uint32_t {
        if (!(v > 0.0f)) return 0u;
        if (v >= 1.0f)   return 255u;
        return static_cast<uint32_t>(v * 255.0f + 0.5f);
    };
    return 0xFF000000u | (q(c.b) << 16) | (q(c.g) << 8) | q(c.r);
}

inline Rgb unpack_rgba(uint32_t p)
{
    return {( p        & 0xFFu) / 255.0f,
            ((p >>  8) & 0xFFu) / 255.0f,
            ((p >> 16) & 0xFFu) / 255.0f};
}
