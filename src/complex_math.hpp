#pragma once

#include <cmath>

// ---------------------------------------------------------------------------
// Complex value type. Immutable by convention: every operation returns a new
// value. div() by zero follows IEEE rules and yields inf/nan components;
// callers that feed the color stage must check std::isfinite first.
// ---------------------------------------------------------------------------
struct Complex {
    double re = 0.0;
    double im = 0.0;
};

inline Complex add(Complex a, Complex b) { return {a.re + b.re, a.im + b.im}; }
inline Complex sub(Complex a, Complex b) { return {a.re - b.re, a.im - b.im}; }

inline Complex mul(Complex a, Complex b)
{
    return {a.re * b.re - a.im * b.im, a.re * b.im + a.im * b.re};
}

inline double magnitude_squared(Complex c) { return c.re * c.re + c.im * c.im; }

inline Complex div(Complex a, Complex b)
{
    const double d = magnitude_squared(b);
    return {(a.re * b.re + a.im * b.im) / d, (a.im * b.re - a.re * b.im) / d};
}

inline bool is_finite(Complex c) { return std::isfinite(c.re) && std::isfinite(c.im); }

// Counter-clockwise rotation of v by `angle` radians.
inline Complex rotate(Complex v, double angle)
{
    const double cs = std::cos(angle);
    const double sn = std::sin(angle);
    return {v.re * cs - v.im * sn, v.re * sn + v.im * cs};
}

// ---------------------------------------------------------------------------
// 2D vector / 2x2 matrix helpers used by the geometry rasterizer
// ---------------------------------------------------------------------------
struct Vec2 {
    double x = 0.0;
    double y = 0.0;
};

struct Mat2 {
    double m00 = 1.0, m01 = 0.0;
    double m10 = 0.0, m11 = 1.0;

    static Mat2 rotation(double angle)
    {
        const double cs = std::cos(angle), sn = std::sin(angle);
        return {cs, -sn, sn, cs};
    }

    Vec2 apply(Vec2 v) const { return {m00 * v.x + m01 * v.y, m10 * v.x + m11 * v.y}; }
};

inline Vec2 lerp(Vec2 a, Vec2 b, double t) { return {a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t}; }

// ---------------------------------------------------------------------------
// Screen <-> complex plane mapping
//
// Screen space: origin top-left, y down, units of pixels.
// Plane space : y up. Visible height is 4/zoom, width is that times w/h.
// Rotation is not applied here; see screen_to_plane() for the rotated view.
// ---------------------------------------------------------------------------
struct ViewCamera {
    Complex center;
    double  zoom     = 1.0;
    double  rotation = 0.0;
};

Complex screen_to_complex(double x, double y, double w, double h, const ViewCamera& cam);
Vec2    complex_to_screen(Complex c, double w, double h, const ViewCamera& cam);

// Rotation-aware mapping: the screen offset from the view center is turned by
// -rotation before it is added to the center. This is the mapping the
// evaluator renders with and the one pan()/zoom_at() keep consistent.
Complex screen_to_plane(double x, double y, double w, double h, const ViewCamera& cam);
Vec2    plane_to_screen(Complex c, double w, double h, const ViewCamera& cam);
