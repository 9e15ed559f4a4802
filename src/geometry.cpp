#include "geometry.hpp"

#include <algorithm>
#include <cmath>

namespace {

constexpr double SEED_SIDE = 0.8;
constexpr double PI        = 3.14159265358979323846;

// ---------------------------------------------------------------------------
// Koch
// ---------------------------------------------------------------------------
void koch_side(Vec2 start, Vec2 end, int depth, int level, std::vector<Segment>& out)
{
    if (depth == 0) {
        out.push_back({start, end, level});
        return;
    }

    const double dx = end.x - start.x;
    const double dy = end.y - start.y;
    const double k  = std::sqrt(3.0) / 6.0;

    const Vec2 p1   = {start.x + dx / 3.0,       start.y + dy / 3.0};
    const Vec2 p2   = {start.x + 2.0 * dx / 3.0, start.y + 2.0 * dy / 3.0};
    const Vec2 peak = {start.x + dx / 2.0 - dy * k, start.y + dy / 2.0 + dx * k};

    koch_side(start, p1,   depth - 1, level + 1, out);
    koch_side(p1,    peak, depth - 1, level + 1, out);
    koch_side(peak,  p2,   depth - 1, level + 1, out);
    koch_side(p2,    end,  depth - 1, level + 1, out);
}

// ---------------------------------------------------------------------------
// Sierpinski
// ---------------------------------------------------------------------------
void sierpinski(Vec2 p1, Vec2 p2, Vec2 p3, int depth, int level, std::vector<Triangle>& out)
{
    if (depth == 0) {
        out.push_back({p1, p2, p3, level});
        return;
    }

    const Vec2 m12 = lerp(p1, p2, 0.5);
    const Vec2 m23 = lerp(p2, p3, 0.5);
    const Vec2 m31 = lerp(p3, p1, 0.5);

    sierpinski(p1,  m12, m31, depth - 1, level + 1, out);
    sierpinski(m12, p2,  m23, depth - 1, level + 1, out);
    sierpinski(m31, m23, p3,  depth - 1, level + 1, out);
}

// ---------------------------------------------------------------------------
// Tree. Angle 0 points straight up; the spread opens toward the crown.
// ---------------------------------------------------------------------------
struct TreeBuilder {
    const TreeShape&      shape;
    std::vector<Segment>& out;

    void branch(Vec2 start, Vec2 end, double angle_deg, int remaining, int level, double length)
    {
        out.push_back({start, end, level});
        if (remaining <= 0) return;

        const double child_len = length * shape.length_ratio;
        const double spread    = shape.branch_angle + 10.0 * level / shape.depth;

        for (double child_angle : {angle_deg - spread, angle_deg + spread}) {
            const double rad = child_angle * PI / 180.0;
            const Vec2   tip = {end.x + std::sin(rad) * child_len, end.y + std::cos(rad) * child_len};
            branch(end, tip, child_angle, remaining - 1, level + 1, child_len);
        }
    }
};

}  // namespace

std::vector<Segment> generate_koch(int depth)
{
    depth = std::clamp(depth, 0, KOCH_MAX_DEPTH);

    const double h  = SEED_SIDE * std::sqrt(3.0) / 2.0;
    const Vec2   p1 = {-SEED_SIDE / 2.0, -h / 3.0};
    const Vec2   p2 = { SEED_SIDE / 2.0, -h / 3.0};
    const Vec2   p3 = { 0.0,              2.0 * h / 3.0};

    std::vector<Segment> out;
    out.reserve(koch_segment_count(depth));
    koch_side(p1, p2, depth, 0, out);
    koch_side(p2, p3, depth, 0, out);
    koch_side(p3, p1, depth, 0, out);
    return out;
}

std::vector<Triangle> generate_sierpinski(int depth)
{
    depth = std::clamp(depth, 0, SIERPINSKI_MAX_DEPTH);

    const double h = SEED_SIDE * std::sqrt(3.0) / 2.0;
    std::vector<Triangle> out;
    out.reserve(sierpinski_triangle_count(depth));
    sierpinski({0.0, h / 2.0}, {-SEED_SIDE / 2.0, -h / 2.0}, {SEED_SIDE / 2.0, -h / 2.0},
               depth, 0, out);
    return out;
}

std::vector<Segment> generate_tree(const TreeShape& shape)
{
    TreeShape s = shape;
    s.depth = std::clamp(s.depth, 0, TREE_MAX_DEPTH);

    constexpr double TRUNK_LENGTH = 0.45;
    const Vec2 base = {0.0, -0.95};
    const Vec2 top  = {0.0, base.y + TRUNK_LENGTH};

    std::vector<Segment> out;
    out.reserve(tree_segment_count(s.depth));
    // A zero depth never reaches the spread formula.
    TreeBuilder{s, out}.branch(base, top, 0.0, s.depth, 0, TRUNK_LENGTH);
    return out;
}
