#include "palette.hpp"

#include <algorithm>
#include <cmath>

// ---------------------------------------------------------------------------
// Color helpers
// ---------------------------------------------------------------------------
Rgb hsv_to_rgb(double h, double s, double v)
{
    h = std::fmod(h, 360.0);
    if (h < 0.0) h += 360.0;
    const double c = v * s;
    const double x = c * (1.0 - std::abs(std::fmod(h / 60.0, 2.0) - 1.0));
    const double m = v - c;

    double r, g, b;
    if      (h <  60.0) { r = c; g = x; b = 0; }
    else if (h < 120.0) { r = x; g = c; b = 0; }
    else if (h < 180.0) { r = 0; g = c; b = x; }
    else if (h < 240.0) { r = 0; g = x; b = c; }
    else if (h < 300.0) { r = x; g = 0; b = c; }
    else                { r = c; g = 0; b = x; }

    return {static_cast<float>(r + m), static_cast<float>(g + m), static_cast<float>(b + m)};
}

Rgb mix(Rgb a, Rgb b, float t)
{
    return {a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t, a.b + (b.b - a.b) * t};
}

Rgb gradient(const Rgb* stops, int n, double t)
{
    if (n <= 0) return {};
    if (n == 1 || !(t > 0.0)) return stops[0];
    if (t >= 1.0) return stops[n - 1];

    const double scaled = t * (n - 1);
    const int    seg    = std::min(static_cast<int>(scaled), n - 2);
    return mix(stops[seg], stops[seg + 1], static_cast<float>(scaled - seg));
}

// ---------------------------------------------------------------------------
// Palette tables
//
// A scheme with zero stops is the HSV rainbow. Escape-time schemes are
// indexed by normalized escape time, geometry schemes by recursion depth.
// ---------------------------------------------------------------------------
namespace {

struct Scheme {
    const char* name;
    int         n;
    Rgb         stops[4];
};

const Scheme MANDELBROT_SCHEMES[] = {
    {"Classic", 4, {{0.0f, 0.0f, 0.5f}, {0.0f, 0.5f, 1.0f}, {1.0f, 1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}}},
    {"Fire",    4, {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 0.0f}, {1.0f, 1.0f, 1.0f}}},
    {"Ice",     4, {{0.0f, 0.0f, 0.1f}, {0.0f, 0.5f, 1.0f}, {0.5f, 0.8f, 1.0f}, {1.0f, 1.0f, 1.0f}}},
    {"Rainbow", 0, {}},
};

const Scheme JULIA_SCHEMES[] = {
    {"Classic",  4, {{0.1f, 0.0f, 0.3f}, {0.5f, 0.0f, 0.8f}, {1.0f, 0.5f, 0.0f}, {1.0f, 1.0f, 0.5f}}},
    {"Electric", 4, {{0.0f, 0.0f, 0.0f}, {0.0f, 0.3f, 1.0f}, {0.8f, 0.8f, 1.0f}, {1.0f, 1.0f, 1.0f}}},
    {"Sunset",   4, {{0.1f, 0.0f, 0.2f}, {0.8f, 0.2f, 0.0f}, {1.0f, 0.6f, 0.0f}, {1.0f, 1.0f, 0.8f}}},
    {"Ocean",    4, {{0.0f, 0.1f, 0.2f}, {0.0f, 0.4f, 0.6f}, {0.0f, 0.8f, 1.0f}, {0.8f, 1.0f, 1.0f}}},
};

const Scheme KOCH_SCHEMES[] = {
    {"Classic", 1, {{0.2f, 0.6f, 1.0f}}},
    {"Fire",    1, {{1.0f, 0.4f, 0.1f}}},
    {"Green",   1, {{0.2f, 0.8f, 0.3f}}},
    {"Purple",  1, {{0.7f, 0.3f, 0.9f}}},
};

const Scheme SIERPINSKI_SCHEMES[] = {
    {"Classic", 3, {{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}, {0.0f, 0.0f, 1.0f}}},
    {"Fire",    3, {{1.0f, 1.0f, 0.0f}, {1.0f, 0.5f, 0.0f}, {1.0f, 0.0f, 0.0f}}},
    {"Ocean",   3, {{0.0f, 1.0f, 1.0f}, {0.0f, 0.5f, 1.0f}, {0.0f, 0.0f, 0.5f}}},
    {"Purple",  3, {{1.0f, 0.0f, 1.0f}, {0.5f, 0.0f, 1.0f}, {0.2f, 0.0f, 0.5f}}},
};

const Scheme TREE_SCHEMES[] = {
    {"Classic", 2, {{0.4f, 0.2f, 0.1f},  {0.1f, 0.7f, 0.1f}}},
    {"Autumn",  3, {{0.3f, 0.15f, 0.05f}, {1.0f, 0.5f, 0.0f}, {1.0f, 0.2f, 0.0f}}},
    {"Spring",  3, {{0.4f, 0.2f, 0.1f},  {0.5f, 1.0f, 0.3f}, {0.1f, 0.6f, 0.1f}}},
    {"Winter",  2, {{0.2f, 0.2f, 0.3f},  {0.7f, 0.9f, 1.0f}}},
};

template<size_t N>
constexpr int count_of(const Scheme (&)[N]) { return static_cast<int>(N); }

const Scheme* schemes_for(FractalKind kind, int& count)
{
    switch (kind) {
        case FractalKind::Mandelbrot: count = count_of(MANDELBROT_SCHEMES); return MANDELBROT_SCHEMES;
        case FractalKind::Julia:      count = count_of(JULIA_SCHEMES);      return JULIA_SCHEMES;
        case FractalKind::Koch:       count = count_of(KOCH_SCHEMES);       return KOCH_SCHEMES;
        case FractalKind::Sierpinski: count = count_of(SIERPINSKI_SCHEMES); return SIERPINSKI_SCHEMES;
        case FractalKind::Tree:       count = count_of(TREE_SCHEMES);       return TREE_SCHEMES;
    }
    count = count_of(MANDELBROT_SCHEMES);
    return MANDELBROT_SCHEMES;
}

const Scheme& scheme_at(FractalKind kind, int scheme)
{
    int n = 0;
    const Scheme* table = schemes_for(kind, n);
    return table[wrap_scheme(kind, scheme)];
}

}  // namespace

int palette_count(FractalKind kind)
{
    int n = 0;
    schemes_for(kind, n);
    return n;
}

const char* palette_name(FractalKind kind, int scheme)
{
    return scheme_at(kind, scheme).name;
}

int wrap_scheme(FractalKind kind, int scheme)
{
    const int n = palette_count(kind);
    int s = scheme % n;
    if (s < 0) s += n;
    return s;
}

Rgb escape_color(double iter, int max_iter, FractalKind kind, int scheme)
{
    if (max_iter <= 0 || !std::isfinite(iter) || iter >= static_cast<double>(max_iter))
        return {};   // interior: black

    double t = iter / static_cast<double>(max_iter);
    t -= std::floor(t);

    const Scheme& s = scheme_at(kind, scheme);
    if (s.n == 0)
        return hsv_to_rgb(t * 360.0, 1.0, 1.0);
    return gradient(s.stops, s.n, t);
}

Rgb geometry_color(FractalKind kind, int scheme, int depth)
{
    const Scheme& s = scheme_at(kind, scheme);
    const double  norm = (kind == FractalKind::Tree) ? 12.0 : 8.0;
    return gradient(s.stops, s.n, std::max(0, depth) / norm);
}
