#include "presets.hpp"

const JuliaPreset JULIA_PRESETS[] = {
    {"Classic",          {-0.7,    0.27015}},
    {"Spiral",           {-0.8,    0.156  }},
    {"Lightning",        {-0.4,    0.6    }},
    {"Feathers",         { 0.285,  0.01   }},
    {"Dendrite",         {-0.75,   0.11   }},
    {"Douady Rabbit",    {-0.123,  0.745  }},
    {"San Marco Dragon", {-0.7,    0.27015}},
    {"Airplane",         {-1.25,   0.0    }},
    {"Fractal Dust",     {-0.8,    0.156  }},
    {"Cauliflower",      { 0.25,   0.0    }},
};
const int JULIA_PRESET_COUNT = static_cast<int>(sizeof(JULIA_PRESETS) / sizeof(JULIA_PRESETS[0]));

const PointOfInterest MANDELBROT_POINTS[] = {
    {"Main Body",       {-0.5,                0.0                }, 1.0   },
    {"Seahorse Valley", {-0.7463,             0.1102             }, 100.0 },
    {"Lightning",       {-1.25066,            0.02012            }, 2000.0},
    {"Spiral",          {-0.7269,             0.1889             }, 8000.0},
    {"Mini Mandelbrot", {-0.16,               1.0405             }, 50.0  },
    {"Feather",         {-0.7463,             0.1102             }, 5000.0},
    {"Tendrils",        { 0.3245046418497685, 0.04855101129280834}, 1000.0},
};
const int MANDELBROT_POINT_COUNT = static_cast<int>(sizeof(MANDELBROT_POINTS) / sizeof(MANDELBROT_POINTS[0]));

const JuliaPreset* find_julia_preset(const std::string& name)
{
    for (int i = 0; i < JULIA_PRESET_COUNT; ++i)
        if (name == JULIA_PRESETS[i].name) return &JULIA_PRESETS[i];
    return nullptr;
}

const PointOfInterest* find_point_of_interest(const std::string& name)
{
    for (int i = 0; i < MANDELBROT_POINT_COUNT; ++i)
        if (name == MANDELBROT_POINTS[i].name) return &MANDELBROT_POINTS[i];
    return nullptr;
}
