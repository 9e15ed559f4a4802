// Compiled with -mavx only; do NOT include from other translation units.

#include "cpu_renderer_avx.hpp"

#include <immintrin.h>
#include <sleef.h>
#include <algorithm>
#include <cmath>

// -----------------------------------------------------------------------
// z <- z^2 + c for 4 lanes. A lane leaves the active set the first time
// |z|^2 > radius^2; its |z|^2 and completed-iteration count are frozen there,
// which makes the result identical to the scalar escape_kernel().
// -----------------------------------------------------------------------
template<bool IsJulia>
static void avx_kernel(double re0, double scale, double im,
                       double c_re, double c_im,
                       int max_iter, double escape_radius, bool smooth,
                       double* value4, int* escaped4)
{
    const __m256d re4 = _mm256_set_pd(re0 + 3.0*scale, re0 + 2.0*scale,
                                      re0 +     scale,  re0);
    __m256d cr, ci, zr, zi;
    if constexpr (IsJulia) {
        cr = _mm256_set1_pd(c_re);
        ci = _mm256_set1_pd(c_im);
        zr = re4;
        zi = _mm256_set1_pd(im);
    } else {
        cr = re4;
        ci = _mm256_set1_pd(im);
        zr = _mm256_setzero_pd();
        zi = _mm256_setzero_pd();
    }

    const __m256d radius_sq = _mm256_set1_pd(escape_radius * escape_radius);
    const __m256d one       = _mm256_set1_pd(1.0);

    __m256d active   = _mm256_castsi256_pd(_mm256_set1_epi64x(-1LL));
    __m256d iters_d  = _mm256_setzero_pd();
    __m256d final_r2 = radius_sq;

    for (int i = 0; i < max_iter; ++i) {
        const __m256d zr2  = _mm256_mul_pd(zr, zr);
        const __m256d zi2  = _mm256_mul_pd(zi, zi);
        const __m256d mag2 = _mm256_add_pd(zr2, zi2);

        const __m256d just_esc = _mm256_and_pd(
            _mm256_cmp_pd(mag2, radius_sq, _CMP_GT_OQ), active);
        final_r2 = _mm256_blendv_pd(final_r2, mag2, just_esc);
        active   = _mm256_andnot_pd(just_esc, active);

        if (_mm256_movemask_pd(active) == 0) break;

        const __m256d new_zi = _mm256_add_pd(_mm256_mul_pd(_mm256_add_pd(zr, zr), zi), ci);
        const __m256d new_zr = _mm256_add_pd(_mm256_sub_pd(zr2, zi2), cr);

        zr = _mm256_blendv_pd(zr, new_zr, active);
        zi = _mm256_blendv_pd(zi, new_zi, active);

        // Counts only iterations a lane actually completed.
        iters_d = _mm256_add_pd(iters_d, _mm256_and_pd(active, one));
    }

    // nu = log(log|z| / log R) / log 2, vectorized through SLEEF
    const double  log_r    = std::log(escape_radius);
    __m256d       value    = iters_d;
    if (smooth && log_r > 0.0) {
        const __m256d half     = _mm256_set1_pd(0.5);
        const __m256d inv_logr = _mm256_set1_pd(1.0 / log_r);
        const __m256d inv_log2 = _mm256_set1_pd(1.0 / std::log(2.0));
        const __m256d log_zn   = _mm256_mul_pd(Sleef_logd4_u35(final_r2), half);
        const __m256d nu       = _mm256_mul_pd(
            Sleef_logd4_u35(_mm256_mul_pd(log_zn, inv_logr)), inv_log2);
        value = _mm256_sub_pd(_mm256_add_pd(iters_d, one), nu);
    }

    double iters[4], vals[4];
    _mm256_storeu_pd(iters, iters_d);
    _mm256_storeu_pd(vals,  value);
    const int inside_bits = _mm256_movemask_pd(active);

    const double below_cap = std::nextafter(static_cast<double>(max_iter), 0.0);
    for (int k = 0; k < 4; ++k) {
        const bool inside = (inside_bits >> k) & 1;
        escaped4[k] = inside ? 0 : 1;
        if (inside) {
            value4[k] = static_cast<double>(max_iter);
        } else {
            const double v = std::isfinite(vals[k]) ? std::max(0.0, vals[k]) : iters[k];
            value4[k] = std::min(v, below_cap);
        }
    }
}

// -----------------------------------------------------------------------
// Public entry points
// -----------------------------------------------------------------------
void avx_mandelbrot_4(double re0, double scale, double im,
                      int max_iter, double escape_radius, bool smooth,
                      double* value4, int* escaped4)
{
    avx_kernel<false>(re0, scale, im, 0.0, 0.0, max_iter, escape_radius, smooth,
                      value4, escaped4);
}

void avx_julia_4(double re0, double scale, double im,
                 double julia_re, double julia_im,
                 int max_iter, double escape_radius, bool smooth,
                 double* value4, int* escaped4)
{
    avx_kernel<true>(re0, scale, im, julia_re, julia_im, max_iter, escape_radius, smooth,
                     value4, escaped4);
}
