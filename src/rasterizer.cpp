#include "rasterizer.hpp"
#include "palette.hpp"

#include <algorithm>
#include <cmath>

Vec2 GeometryTransform::to_clip(Vec2 p) const
{
    Vec2 q = rot.apply(p);
    q = {q.x * zoom + center.x, q.y * zoom + center.y};
    q.x /= aspect;
    return q;
}

Vec2 GeometryTransform::to_pixel(Vec2 p) const
{
    const Vec2 c = to_clip(p);
    return {(c.x * 0.5 + 0.5) * width, (0.5 - c.y * 0.5) * height};
}

GeometryTransform make_geometry_transform(const ShaderParams& sp, int width, int height)
{
    GeometryTransform xf;
    xf.rot    = Mat2::rotation(sp.rotation);
    xf.zoom   = sp.zoom;
    xf.center = {sp.center.re, sp.center.im};
    xf.aspect = sp.aspect;
    xf.width  = width;
    xf.height = height;
    return xf;
}

// ---------------------------------------------------------------------------
// Pixel-space bounding box clipped to the buffer. Coordinates can be huge at
// deep zoom, so clamp before converting to int.
// ---------------------------------------------------------------------------
struct PixelBox {
    int x0, x1, y0, y1;
};

static bool clip_box(double min_x, double max_x, double min_y, double max_y,
                     const PixelBuffer& buf, PixelBox& box)
{
    if (!(max_x >= 0.0) || !(max_y >= 0.0) || !(min_x < buf.width) || !(min_y < buf.height))
        return false;
    box.x0 = static_cast<int>(std::floor(std::max(min_x, 0.0)));
    box.y0 = static_cast<int>(std::floor(std::max(min_y, 0.0)));
    box.x1 = static_cast<int>(std::min(std::ceil(max_x), buf.width  - 1.0));
    box.y1 = static_cast<int>(std::min(std::ceil(max_y), buf.height - 1.0));
    return box.x0 <= box.x1 && box.y0 <= box.y1;
}

// ---------------------------------------------------------------------------
// Lines: every pixel center within half the width of the segment is set.
// ---------------------------------------------------------------------------
static void draw_line(Vec2 a, Vec2 b, double half_w, uint32_t color, PixelBuffer& buf)
{
    PixelBox box;
    if (!clip_box(std::min(a.x, b.x) - half_w, std::max(a.x, b.x) + half_w,
                  std::min(a.y, b.y) - half_w, std::max(a.y, b.y) + half_w, buf, box))
        return;

    const double dx  = b.x - a.x;
    const double dy  = b.y - a.y;
    const double len2 = dx * dx + dy * dy;
    const double hw2  = half_w * half_w;

    for (int y = box.y0; y <= box.y1; ++y) {
        const double py = y + 0.5;
        for (int x = box.x0; x <= box.x1; ++x) {
            const double px = x + 0.5;
            double t = len2 > 0.0 ? ((px - a.x) * dx + (py - a.y) * dy) / len2 : 0.0;
            t = std::clamp(t, 0.0, 1.0);
            const double ex = a.x + t * dx - px;
            const double ey = a.y + t * dy - py;
            if (ex * ex + ey * ey <= hw2)
                buf.at(x, y) = color;
        }
    }
}

void draw_segments(const std::vector<Segment>& segs, const GeometryTransform& xf,
                   FractalKind kind, int scheme, double line_width, PixelBuffer& buf)
{
    if (buf.empty()) return;
    const double half_w = std::max(0.5, line_width * 0.5);
    for (const Segment& s : segs) {
        const uint32_t color = pack_rgba(geometry_color(kind, scheme, s.depth));
        draw_line(xf.to_pixel(s.a), xf.to_pixel(s.b), half_w, color, buf);
    }
}

// ---------------------------------------------------------------------------
// Triangles: edge functions over the clipped bounding box, either winding.
// ---------------------------------------------------------------------------
static double edge(Vec2 a, Vec2 b, double px, double py)
{
    return (b.x - a.x) * (py - a.y) - (b.y - a.y) * (px - a.x);
}

void fill_triangles(const std::vector<Triangle>& tris, const GeometryTransform& xf,
                    FractalKind kind, int scheme, PixelBuffer& buf)
{
    if (buf.empty()) return;

    for (const Triangle& t : tris) {
        const Vec2 a = xf.to_pixel(t.a);
        const Vec2 b = xf.to_pixel(t.b);
        const Vec2 c = xf.to_pixel(t.c);

        const double area = edge(a, b, c.x, c.y);
        if (area == 0.0) continue;

        PixelBox box;
        if (!clip_box(std::min({a.x, b.x, c.x}), std::max({a.x, b.x, c.x}),
                      std::min({a.y, b.y, c.y}), std::max({a.y, b.y, c.y}), buf, box))
            continue;

        const uint32_t color = pack_rgba(geometry_color(kind, scheme, t.depth));
        const double   sign  = area > 0.0 ? 1.0 : -1.0;

        for (int y = box.y0; y <= box.y1; ++y) {
            const double py = y + 0.5;
            for (int x = box.x0; x <= box.x1; ++x) {
                const double px = x + 0.5;
                if (sign * edge(a, b, px, py) >= 0.0 &&
                    sign * edge(b, c, px, py) >= 0.0 &&
                    sign * edge(c, a, px, py) >= 0.0)
                    buf.at(x, y) = color;
            }
        }
    }
}
