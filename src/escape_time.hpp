#pragma once

#include "complex_math.hpp"
#include "double_double.hpp"
#include "view_state.hpp"

// Hard ceiling on iterations per pixel, whatever the user asks for.
constexpr int MAX_ITERATIONS_CAP = 8000;

inline int clamp_iterations(int n)
{
    return n < 1 ? 1 : (n > MAX_ITERATIONS_CAP ? MAX_ITERATIONS_CAP : n);
}

// Outcome of iterating one point. `iterations` is the index i at which
// |z|^2 first exceeded the radius^2 (escaped), or max_iter (inside).
struct EscapeResult {
    int    iterations   = 0;
    double magnitude_sq = 0.0;   // |z|^2 at escape
    bool   escaped      = false;
};

// ---------------------------------------------------------------------------
// z <- z^2 + c until |z|^2 > radius^2 (strict) or the cap is reached.
// Mandelbrot: z0 = 0, c = p.   Julia: z0 = p, c = constant.
// ---------------------------------------------------------------------------
template<bool IsJulia>
inline EscapeResult escape_kernel(Complex p, Complex k, int max_iter, double radius_sq)
{
    double zr = IsJulia ? p.re : 0.0;
    double zi = IsJulia ? p.im : 0.0;
    const double cr = IsJulia ? k.re : p.re;
    const double ci = IsJulia ? k.im : p.im;

    for (int i = 0; i < max_iter; ++i) {
        const double zr2 = zr*zr, zi2 = zi*zi;
        if (zr2 + zi2 > radius_sq)
            return {i, zr2 + zi2, true};
        zi = 2.0*zr*zi + ci;
        zr = zr2 - zi2 + cr;
    }
    return {max_iter, zr*zr + zi*zi, false};
}

// Same loop in double-double. The escape test only needs the high words.
template<bool IsJulia>
inline EscapeResult escape_kernel_dd(DDComplex p, DDComplex k, int max_iter, double radius_sq)
{
    DDComplex z = IsJulia ? p : DDComplex{};
    const DDComplex c = IsJulia ? k : p;

    for (int i = 0; i < max_iter; ++i) {
        const double m2 = dd_magnitude_squared(z);
        if (m2 > radius_sq)
            return {i, m2, true};
        z = dd_add(dd_square(z), c);
    }
    return {max_iter, dd_magnitude_squared(z), false};
}

// Continuous escape time: i + 1 - log(log(|z|^2)/2 / log R) / log 2.
// Falls back to the integer index when the formula is not finite (R <= 1,
// overflowed |z|) and never returns a negative value.
double smooth_iteration(const EscapeResult& r, double escape_radius);

// Value handed to the color stage: max_iter for inside points, otherwise the
// smooth or integer escape time. Always finite.
double escape_value(const EscapeResult& r, int max_iter, double escape_radius, bool smooth);

// Dispatch on fractal kind and precision. `offset` is the plane offset of the
// sample from `center`; in compensated mode the sum is kept exact.
EscapeResult evaluate_point(FractalKind kind, Complex center, Complex offset,
                            Complex julia_c, int max_iter, double escape_radius,
                            bool compensated);
