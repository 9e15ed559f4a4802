#pragma once

#include "geometry.hpp"
#include "pixel_buffer.hpp"
#include "view_state.hpp"
#include "viewport.hpp"

// Model space -> pixel space for the geometric fractals:
//   clip = R(rotation) * p * zoom + center,  clip.x /= aspect
// then clip [-1, 1] maps onto the framebuffer with y up.
struct GeometryTransform {
    Mat2   rot;
    double zoom   = 1.0;
    Vec2   center;
    double aspect = 1.0;
    int    width  = 0;
    int    height = 0;

    Vec2 to_clip(Vec2 p) const;
    Vec2 to_pixel(Vec2 p) const;
};

GeometryTransform make_geometry_transform(const ShaderParams& sp, int width, int height);

// Segments are drawn `line_width` pixels wide, in emission order.
void draw_segments(const std::vector<Segment>& segs, const GeometryTransform& xf,
                   FractalKind kind, int scheme, double line_width, PixelBuffer& buf);

void fill_triangles(const std::vector<Triangle>& tris, const GeometryTransform& xf,
                    FractalKind kind, int scheme, PixelBuffer& buf);
