#pragma once

#include "complex_math.hpp"

#include <vector>

// Hard caps, applied whatever the caller asks for.
constexpr int KOCH_MAX_DEPTH       = 8;
constexpr int SIERPINSKI_MAX_DEPTH = 10;
constexpr int TREE_MAX_DEPTH       = 12;

// Line segment or filled triangle in model space, tagged with the
// subdivision level that produced it (drives depth-based coloring).
struct Segment {
    Vec2 a;
    Vec2 b;
    int  depth = 0;
};

struct Triangle {
    Vec2 a;
    Vec2 b;
    Vec2 c;
    int  depth = 0;
};

struct TreeShape {
    int    depth        = 10;
    double branch_angle = 30.0;   // degrees
    double length_ratio = 0.7;
};

// Koch snowflake: 3 * 4^depth segments, sides p1->p2, p2->p3, p3->p1.
std::vector<Segment> generate_koch(int depth);

// Sierpinski triangle: 3^depth filled triangles.
std::vector<Triangle> generate_sierpinski(int depth);

// Binary tree: 2^(depth+1) - 1 segments, parent emitted before children.
std::vector<Segment> generate_tree(const TreeShape& shape);

inline size_t koch_segment_count(int depth)
{
    size_t n = 3;
    for (int i = 0; i < depth; ++i) n *= 4;
    return n;
}

inline size_t sierpinski_triangle_count(int depth)
{
    size_t n = 1;
    for (int i = 0; i < depth; ++i) n *= 3;
    return n;
}

inline size_t tree_segment_count(int depth)
{
    return (size_t(1) << (depth + 1)) - 1;
}
