#include "fractal.hpp"
#include "escape_time.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

bool fractal_from_id(const char* id, FractalKind& out)
{
    if (!id) return false;
    for (int i = 0; i < FRACTAL_KIND_COUNT; ++i) {
        const auto k = static_cast<FractalKind>(i);
        if (std::strcmp(id, fractal_id(k)) == 0) {
            out = k;
            return true;
        }
    }
    return false;
}

FractalKind fractal_kind(const FractalParams& p)
{
    return static_cast<FractalKind>(p.index());
}

FractalParams default_params(FractalKind kind)
{
    switch (kind) {
        case FractalKind::Mandelbrot: return MandelbrotParams{};
        case FractalKind::Julia:      return JuliaParams{};
        case FractalKind::Koch:       return KochParams{};
        case FractalKind::Sierpinski: return SierpinskiParams{};
        case FractalKind::Tree:       return TreeParams{};
    }
    return MandelbrotParams{};
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------
static double clamp_finite(double v, double lo, double hi, double fallback)
{
    if (!std::isfinite(v)) return fallback;
    return std::clamp(v, lo, hi);
}

int min_depth(FractalKind kind)
{
    switch (kind) {
        case FractalKind::Koch:       return KOCH_MIN_DEPTH;
        case FractalKind::Sierpinski: return SIERPINSKI_MIN_DEPTH;
        case FractalKind::Tree:       return TREE_MIN_DEPTH;
        default:                      return -1;
    }
}

int max_depth(FractalKind kind)
{
    switch (kind) {
        case FractalKind::Koch:       return KOCH_MAX_DEPTH;
        case FractalKind::Sierpinski: return SIERPINSKI_MAX_DEPTH;
        case FractalKind::Tree:       return TREE_MAX_DEPTH;
        default:                      return -1;
    }
}

FractalParams validate_params(const FractalParams& p)
{
    FractalParams out = p;
    switch (fractal_kind(p)) {
        case FractalKind::Mandelbrot:
            break;
        case FractalKind::Julia: {
            auto& j = std::get<JuliaParams>(out);
            const JuliaParams def;
            j.c.re = clamp_finite(j.c.re, -JULIA_C_LIMIT, JULIA_C_LIMIT, def.c.re);
            j.c.im = clamp_finite(j.c.im, -JULIA_C_LIMIT, JULIA_C_LIMIT, def.c.im);
            break;
        }
        case FractalKind::Koch: {
            auto& k = std::get<KochParams>(out);
            k.depth = std::clamp(k.depth, KOCH_MIN_DEPTH, KOCH_MAX_DEPTH);
            break;
        }
        case FractalKind::Sierpinski: {
            auto& s = std::get<SierpinskiParams>(out);
            s.depth = std::clamp(s.depth, SIERPINSKI_MIN_DEPTH, SIERPINSKI_MAX_DEPTH);
            break;
        }
        case FractalKind::Tree: {
            TreeShape&      t = std::get<TreeParams>(out).shape;
            const TreeShape def;
            t.depth        = std::clamp(t.depth, TREE_MIN_DEPTH, TREE_MAX_DEPTH);
            t.branch_angle = clamp_finite(t.branch_angle, TREE_MIN_ANGLE, TREE_MAX_ANGLE, def.branch_angle);
            t.length_ratio = clamp_finite(t.length_ratio, TREE_MIN_RATIO, TREE_MAX_RATIO, def.length_ratio);
            break;
        }
    }
    return out;
}

int recursion_depth(const FractalParams& p)
{
    switch (fractal_kind(p)) {
        case FractalKind::Koch:       return std::get<KochParams>(p).depth;
        case FractalKind::Sierpinski: return std::get<SierpinskiParams>(p).depth;
        case FractalKind::Tree:       return std::get<TreeParams>(p).shape.depth;
        default:                      return -1;
    }
}

int set_recursion_depth(FractalParams& p, int depth)
{
    const FractalKind kind = fractal_kind(p);
    if (is_escape_time(kind)) return -1;

    depth = std::clamp(depth, min_depth(kind), max_depth(kind));
    switch (kind) {
        case FractalKind::Koch:       std::get<KochParams>(p).depth       = depth; break;
        case FractalKind::Sierpinski: std::get<SierpinskiParams>(p).depth = depth; break;
        case FractalKind::Tree:       std::get<TreeParams>(p).shape.depth = depth; break;
        default: break;
    }
    return depth;
}

// ---------------------------------------------------------------------------
// Text
// ---------------------------------------------------------------------------
std::string equation(const FractalParams& p)
{
    char buf[96];
    switch (fractal_kind(p)) {
        case FractalKind::Mandelbrot:
            return "z(n+1) = z(n)^2 + c";
        case FractalKind::Julia: {
            const Complex c = std::get<JuliaParams>(p).c;
            std::snprintf(buf, sizeof(buf), "z(n+1) = z(n)^2 + c   (c = %.3f %+.3fi)", c.re, c.im);
            return buf;
        }
        case FractalKind::Koch:
            return "F -> F+F--F+F";
        case FractalKind::Sierpinski:
            return "T -> T1 + T2 + T3";
        case FractalKind::Tree:
            std::snprintf(buf, sizeof(buf), "L -> L[+L][-L]   (angle %.0f deg)",
                          std::get<TreeParams>(p).shape.branch_angle);
            return buf;
    }
    return {};
}

const char* description(FractalKind kind)
{
    switch (kind) {
        case FractalKind::Mandelbrot:
            return "Points c for which z -> z^2 + c stays bounded when iterated from z = 0.";
        case FractalKind::Julia:
            return "Points z0 that stay bounded under z -> z^2 + c for a fixed constant c.";
        case FractalKind::Koch:
            return "Koch snowflake: every segment is replaced by four, one third as long.";
        case FractalKind::Sierpinski:
            return "Sierpinski triangle: the middle quarter of every triangle is removed.";
        case FractalKind::Tree:
            return "Binary tree: every branch forks into two shorter ones.";
    }
    return "";
}

bool julia_is_connected(Complex c, int max_iter)
{
    return !evaluate_point(FractalKind::Mandelbrot, c, Complex{}, Complex{},
                           max_iter, 2.0, false).escaped;
}
