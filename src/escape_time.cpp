#include "escape_time.hpp"

#include <algorithm>
#include <cmath>

double smooth_iteration(const EscapeResult& r, double escape_radius)
{
    const double fallback = static_cast<double>(r.iterations);
    if (!r.escaped) return fallback;

    const double log_r = std::log(escape_radius);
    if (!(log_r > 0.0)) return fallback;

    const double log_zn = std::log(r.magnitude_sq) * 0.5;
    const double nu     = std::log(log_zn / log_r) / std::log(2.0);
    const double value  = static_cast<double>(r.iterations) + 1.0 - nu;
    if (!std::isfinite(value)) return fallback;
    return std::max(0.0, value);
}

double escape_value(const EscapeResult& r, int max_iter, double escape_radius, bool smooth)
{
    if (!r.escaped) return static_cast<double>(max_iter);
    const double v = smooth ? smooth_iteration(r, escape_radius)
                            : static_cast<double>(r.iterations);
    // Smooth values sit in [i, i+1); keep them strictly below the cap.
    return std::min(v, std::nextafter(static_cast<double>(max_iter), 0.0));
}

EscapeResult evaluate_point(FractalKind kind, Complex center, Complex offset,
                            Complex julia_c, int max_iter, double escape_radius,
                            bool compensated)
{
    max_iter = clamp_iterations(max_iter);
    const double radius_sq = escape_radius * escape_radius;
    const bool   julia     = (kind == FractalKind::Julia);

    if (compensated) {
        const DDComplex p = dd_offset(center, offset);
        return julia ? escape_kernel_dd<true >(p, dd_complex(julia_c), max_iter, radius_sq)
                     : escape_kernel_dd<false>(p, DDComplex{},        max_iter, radius_sq);
    }

    const Complex p = add(center, offset);
    return julia ? escape_kernel<true >(p, julia_c,   max_iter, radius_sq)
                 : escape_kernel<false>(p, Complex{}, max_iter, radius_sq);
}
