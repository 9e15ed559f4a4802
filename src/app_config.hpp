#pragma once

#include "view_state.hpp"

#include <spdlog/common.h>

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Startup configuration: compile-time defaults, overridden by argv.
// ---------------------------------------------------------------------------
struct AppConfig {
    int         window_w     = 1280;
    int         window_h     = 720;
    FractalKind fractal      = FractalKind::Mandelbrot;
    int         iterations   = 256;
    double      render_scale = 1.0;
    int         threads      = 0;       // 0: hardware concurrency
    spdlog::level::level_enum log_level = spdlog::level::info;

    std::string session_path;           // loaded at start when set
    std::string render_path;            // headless single frame
    bool        benchmark = false;      // headless timing table
    bool        show_help = false;

    bool headless() const { return benchmark || !render_path.empty(); }
};

struct ConfigResult {
    AppConfig                config;
    std::vector<std::string> warnings;  // unknown flags, bad values
};

// Values are clamped like UI input; unknown flags become warnings.
ConfigResult parse_args(int argc, const char* const* argv);

void print_usage(const char* prog);
