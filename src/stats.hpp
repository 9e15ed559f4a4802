#pragma once

#include "fractal.hpp"

#include <cstdint>
#include <vector>

struct FractalStats {
    double    area_ratio        = 0.0;   // fraction of pixels inside the set
    double    convergence_ratio = 0.0;   // fraction of pixels that escaped
    long long boundary_points   = 0;
    double    fractal_dimension = 0.0;
    double    render_ms         = 0.0;
    bool      connected         = true;  // Julia only
};

// Per-pixel inside fraction of the last escape-time frame: 1 for a pixel
// whose samples all stayed bounded, 0 for one that fully escaped.
struct Coverage {
    std::vector<float> inside;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        inside.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0.0f);
    }

    float at(int x, int y) const { return inside[static_cast<size_t>(y) * width + x]; }
};

// Pixels inside the set with an escaped 4-neighbour, plus every mixed pixel.
std::vector<uint8_t> boundary_mask(const Coverage& cov);

// Least-squares slope of log N(s) over log(1/s) for box sizes 2, 4, 8, 16.
// 0 when fewer than two sizes hit the mask.
double box_counting_dimension(const std::vector<uint8_t>& mask, int w, int h);

FractalStats escape_time_statistics(const Coverage& cov, const FractalParams& params);
FractalStats geometry_statistics(const FractalParams& params);

// Dispatches on the active fractal.
FractalStats compute_statistics(const FractalParams& params, const Coverage& cov, double render_ms);
