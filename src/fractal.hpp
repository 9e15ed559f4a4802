#pragma once

#include "complex_math.hpp"
#include "geometry.hpp"
#include "view_state.hpp"

#include <string>
#include <variant>

// ---------------------------------------------------------------------------
// Per-fractal parameters. Exactly one is active at a time, held in the
// FractalParams variant; every operation dispatches with a single switch.
// ---------------------------------------------------------------------------
struct MandelbrotParams {};

struct JuliaParams {
    Complex c{-0.7, 0.27015};
};

struct KochParams {
    int depth = 4;
};

struct SierpinskiParams {
    int depth = 6;
};

struct TreeParams {
    TreeShape shape;
};

using FractalParams = std::variant<MandelbrotParams, JuliaParams, KochParams,
                                   SierpinskiParams, TreeParams>;

// User-facing limits.
constexpr double JULIA_C_LIMIT      = 2.0;
constexpr int    KOCH_MIN_DEPTH     = 1;
constexpr int    SIERPINSKI_MIN_DEPTH = 1;
constexpr int    TREE_MIN_DEPTH     = 1;
constexpr double TREE_MIN_ANGLE     = 5.0;
constexpr double TREE_MAX_ANGLE     = 90.0;
constexpr double TREE_MIN_RATIO     = 0.3;
constexpr double TREE_MAX_RATIO     = 0.9;

FractalKind   fractal_kind(const FractalParams& p);
FractalParams default_params(FractalKind kind);

// Clamps every field into its user-facing range. Non-finite values fall
// back to the defaults.
FractalParams validate_params(const FractalParams& p);

// Recursion depth of a geometric fractal, -1 for the escape-time ones.
int  recursion_depth(const FractalParams& p);
int  min_depth(FractalKind kind);
int  max_depth(FractalKind kind);

// Returns the clamped depth actually stored; no-op for escape-time kinds.
int  set_recursion_depth(FractalParams& p, int depth);

// Formula shown next to the fractal name.
std::string equation(const FractalParams& p);
const char* description(FractalKind kind);

// A Julia set is connected iff its constant lies in the Mandelbrot set.
bool julia_is_connected(Complex c, int max_iter = 256);
