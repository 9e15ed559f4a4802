#pragma once

#include "complex_math.hpp"

// ---------------------------------------------------------------------------
// Double-double arithmetic (hi + lo, |lo| <= ulp(hi)/2)
//
// Error-free transforms after Dekker/Knuth: two_sum() recovers the rounding
// error of an addition, two_prod() that of a multiplication via Veltkamp
// splitting. Roughly 106 bits of mantissa. Must not be compiled with
// -ffast-math, which lets the compiler cancel the error terms.
// ---------------------------------------------------------------------------
struct DD {
    double hi = 0.0;
    double lo = 0.0;
};

inline DD two_sum(double a, double b)
{
    const double s = a + b;
    const double v = s - a;
    const double e = (a - (s - v)) + (b - v);
    return {s, e};
}

inline DD quick_two_sum(double a, double b)
{
    const double s = a + b;
    return {s, b - (s - a)};
}

inline DD split(double a)
{
    constexpr double SPLITTER = 134217729.0;  // 2^27 + 1
    const double c  = SPLITTER * a;
    const double hi = c - (c - a);
    return {hi, a - hi};
}

inline DD two_prod(double a, double b)
{
    const double p  = a * b;
    const DD     as = split(a);
    const DD     bs = split(b);
    const double e  = ((as.hi * bs.hi - p) + as.hi * bs.lo + as.lo * bs.hi) + as.lo * bs.lo;
    return {p, e};
}

inline DD dd_add(DD a, DD b)
{
    DD s = two_sum(a.hi, b.hi);
    DD t = two_sum(a.lo, b.lo);
    s.lo += t.hi;
    s = quick_two_sum(s.hi, s.lo);
    s.lo += t.lo;
    return quick_two_sum(s.hi, s.lo);
}

inline DD dd_neg(DD a) { return {-a.hi, -a.lo}; }
inline DD dd_sub(DD a, DD b) { return dd_add(a, dd_neg(b)); }

inline DD dd_mul(DD a, DD b)
{
    DD p = two_prod(a.hi, b.hi);
    p.lo += a.hi * b.lo + a.lo * b.hi;
    return quick_two_sum(p.hi, p.lo);
}

inline DD dd_mul_pow2(DD a, double p2) { return {a.hi * p2, a.lo * p2}; }

inline double dd_to_double(DD a) { return a.hi + a.lo; }

// ---------------------------------------------------------------------------
// Complex number with double-double components
// ---------------------------------------------------------------------------
struct DDComplex {
    DD re;
    DD im;
};

inline DDComplex dd_complex(Complex c) { return {{c.re, 0.0}, {c.im, 0.0}}; }

// center + offset, keeping the rounding error of the sum instead of dropping
// it. This is what lets neighbouring deep-zoom pixels stay distinct.
inline DDComplex dd_offset(Complex center, Complex offset)
{
    return {two_sum(center.re, offset.re), two_sum(center.im, offset.im)};
}

inline DDComplex dd_add(DDComplex a, DDComplex b) { return {dd_add(a.re, b.re), dd_add(a.im, b.im)}; }

inline DDComplex dd_square(DDComplex z)
{
    const DD re2 = dd_mul(z.re, z.re);
    const DD im2 = dd_mul(z.im, z.im);
    const DD ri  = dd_mul(z.re, z.im);
    return {dd_sub(re2, im2), dd_mul_pow2(ri, 2.0)};
}

inline double dd_magnitude_squared(DDComplex z)
{
    return z.re.hi * z.re.hi + z.im.hi * z.im.hi;
}
