#include "stats.hpp"

#include <cmath>

std::vector<uint8_t> boundary_mask(const Coverage& cov)
{
    const int W = cov.width, H = cov.height;
    std::vector<uint8_t> mask(static_cast<size_t>(W) * static_cast<size_t>(H), 0);

    auto escaped = [&](int x, int y) {
        if (x < 0 || y < 0 || x >= W || y >= H) return false;
        return cov.at(x, y) < 0.5f;
    };

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const float f = cov.at(x, y);
            bool edge = f > 0.0f && f < 1.0f;
            if (!edge && f >= 0.5f)
                edge = escaped(x - 1, y) || escaped(x + 1, y) ||
                       escaped(x, y - 1) || escaped(x, y + 1);
            mask[static_cast<size_t>(y) * W + x] = edge ? 1 : 0;
        }
    }
    return mask;
}

double box_counting_dimension(const std::vector<uint8_t>& mask, int w, int h)
{
    static const int SIZES[] = {2, 4, 8, 16};

    double sx = 0, sy = 0, sxx = 0, sxy = 0;
    int    n  = 0;

    for (int s : SIZES) {
        long long count = 0;
        for (int by = 0; by < h; by += s) {
            for (int bx = 0; bx < w; bx += s) {
                bool hit = false;
                for (int y = by; y < by + s && y < h && !hit; ++y)
                    for (int x = bx; x < bx + s && x < w; ++x)
                        if (mask[static_cast<size_t>(y) * w + x]) { hit = true; break; }
                if (hit) ++count;
            }
        }
        if (count == 0) continue;

        const double lx = std::log(1.0 / s);
        const double ly = std::log(static_cast<double>(count));
        sx += lx; sy += ly; sxx += lx * lx; sxy += lx * ly;
        ++n;
    }

    if (n < 2) return 0.0;
    const double denom = n * sxx - sx * sx;
    if (denom == 0.0) return 0.0;
    return (n * sxy - sx * sy) / denom;
}

FractalStats escape_time_statistics(const Coverage& cov, const FractalParams& params)
{
    FractalStats st;
    const size_t total = cov.inside.size();
    if (total == 0) return st;

    double inside = 0.0;
    for (float f : cov.inside) inside += f;

    const std::vector<uint8_t> mask = boundary_mask(cov);
    long long boundary = 0;
    for (uint8_t m : mask) boundary += m;

    st.area_ratio        = inside / static_cast<double>(total);
    st.convergence_ratio = 1.0 - st.area_ratio;
    st.boundary_points   = boundary;

    if (fractal_kind(params) == FractalKind::Mandelbrot) {
        st.fractal_dimension = 2.0;
    } else {
        st.fractal_dimension = box_counting_dimension(mask, cov.width, cov.height);
        st.connected         = julia_is_connected(std::get<JuliaParams>(params).c);
    }
    return st;
}

FractalStats geometry_statistics(const FractalParams& params)
{
    FractalStats st;
    st.convergence_ratio = 1.0;

    switch (fractal_kind(params)) {
        case FractalKind::Koch: {
            const int d = std::get<KochParams>(params).depth;
            st.boundary_points   = static_cast<long long>(koch_segment_count(d));
            st.fractal_dimension = std::log(4.0) / std::log(3.0);
            break;
        }
        case FractalKind::Sierpinski: {
            const int d = std::get<SierpinskiParams>(params).depth;
            st.boundary_points   = static_cast<long long>(sierpinski_triangle_count(d));
            st.fractal_dimension = std::log(3.0) / std::log(2.0);
            st.area_ratio        = std::pow(0.75, d);
            break;
        }
        case FractalKind::Tree: {
            const TreeShape& t = std::get<TreeParams>(params).shape;
            st.boundary_points   = static_cast<long long>(tree_segment_count(t.depth));
            st.fractal_dimension = std::log(2.0) / std::log(1.0 / t.length_ratio);
            break;
        }
        default:
            break;
    }
    return st;
}

FractalStats compute_statistics(const FractalParams& params, const Coverage& cov, double render_ms)
{
    FractalStats st = is_escape_time(fractal_kind(params))
        ? escape_time_statistics(cov, params)
        : geometry_statistics(params);
    st.render_ms = render_ms;
    return st;
}
