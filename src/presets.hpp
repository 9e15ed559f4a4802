#pragma once

#include "complex_math.hpp"

#include <string>

struct JuliaPreset {
    const char* name;
    Complex     c;
};

struct PointOfInterest {
    const char* name;
    Complex     center;
    double      zoom;
};

extern const JuliaPreset     JULIA_PRESETS[];
extern const int             JULIA_PRESET_COUNT;
extern const PointOfInterest MANDELBROT_POINTS[];
extern const int             MANDELBROT_POINT_COUNT;

// nullptr for an unknown name. Lookup is exact and case-sensitive.
const JuliaPreset*     find_julia_preset(const std::string& name);
const PointOfInterest* find_point_of_interest(const std::string& name);
