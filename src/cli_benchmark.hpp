#pragma once

#include "app_config.hpp"
#include "engine.hpp"
#include "export.hpp"

#include <algorithm>
#include <cstdio>
#include <vector>

// ---------------------------------------------------------------------------
// Headless timing table: one thread, best-of-N, each fractal kind at a
// representative view, AVX and scalar paths where it matters.
// ---------------------------------------------------------------------------
inline int run_cli_benchmark(const AppConfig& cfg)
{
    constexpr int W = 960, H = 540, RUNS = 4, BEST_N = 2;

    EngineOptions opt;
    opt.threads = 1;
    Engine engine(opt);
    engine.resize(W, H);
    engine.set_max_iterations(cfg.iterations);

    struct TestCase {
        const char* label;
        FractalKind kind;
        ViewCamera  cam;
        bool        force_scalar;
    };

    const ViewCamera home{{-0.5, 0.0}, 1.0, 0.0};
    const ViewCamera origin{{0.0, 0.0}, 1.0, 0.0};
    const ViewCamera seahorse{{-0.743643887, 0.131825904}, 50.0, 0.0};
    const ViewCamera deep{{-0.743643887, 0.131825904}, 200.0, 0.0};

    const TestCase tests[] = {
        {"Mandelbrot",                FractalKind::Mandelbrot, home,     false},
        {"Julia",                     FractalKind::Julia,      origin,   false},
        {"Mandelbrot",                FractalKind::Mandelbrot, home,     true },
        {"Julia",                     FractalKind::Julia,      origin,   true },
        {"Mandelbrot (compensated)",  FractalKind::Mandelbrot, seahorse, true },
        {"Mandelbrot (4x4 samples)",  FractalKind::Mandelbrot, deep,     true },
        {"Koch Curve",                FractalKind::Koch,       origin,   true },
        {"Sierpinski",                FractalKind::Sierpinski, origin,   true },
        {"Fractal Tree",              FractalKind::Tree,       origin,   true },
    };

    CpuRenderer& renderer = engine.renderer();
    renderer.set_avx(true);
    const bool has_avx = renderer.avx_active;

    std::printf("Fractal Studio CLI Benchmark\n");
    std::printf("%dx%d, %d iter, 1 thread, %d runs (avg best %d)\n",
                W, H, engine.max_iterations(), RUNS, BEST_N);
    std::printf("AVX supported: %s\n\n", has_avx ? "yes" : "no");
    std::printf("%-30s %-10s %s\n", "Label", "Path", "Mpix/s");
    std::printf("------------------------------------------------\n");

    for (const auto& t : tests) {
        if (!engine.set_fractal(t.kind)) {
            std::printf("%-30s %-10s %s\n", t.label, "-", "unavailable");
            continue;
        }
        engine.viewport().jump_to(t.cam);
        renderer.set_avx(!t.force_scalar && has_avx);

        // Warm-up
        engine.invalidate();
        engine.frame(REFERENCE_TICK);

        std::vector<double> times(RUNS);
        for (int r = 0; r < RUNS; ++r) {
            engine.invalidate();
            engine.frame(REFERENCE_TICK);
            times[r] = engine.last_render_ms();
        }
        std::sort(times.begin(), times.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
        avg_ms = std::max(avg_ms / BEST_N, 1e-3);
        const double mpixs = (W * H) / (avg_ms * 1000.0);

        const char* path_label = "scalar";
        if (!is_escape_time(t.kind))
            path_label = "raster";
        else if (renderer.avx_active)
            path_label = "AVX";

        std::printf("%-30s %-10s %6.2f\n", t.label, path_label, mpixs);
    }

    renderer.set_avx(has_avx);
    return 0;
}

// ---------------------------------------------------------------------------
// Headless single frame: settle the view, render, write by extension.
// ---------------------------------------------------------------------------
inline int run_cli_render(const AppConfig& cfg)
{
    constexpr int MAX_SETTLE_FRAMES = 600;

    EngineOptions opt;
    opt.threads = cfg.threads;
    opt.initial = cfg.fractal;
    Engine engine(opt);
    engine.resize(cfg.window_w, cfg.window_h);
    engine.set_render_scale(cfg.render_scale);
    engine.set_max_iterations(cfg.iterations);

    if (!cfg.session_path.empty() && !engine.load_session(cfg.session_path).empty())
        return 1;

    for (int i = 0; i < MAX_SETTLE_FRAMES && !engine.viewport().settled(); ++i)
        engine.frame(REFERENCE_TICK);
    engine.refresh_statistics();
    engine.frame(REFERENCE_TICK);

    const std::string err = save_image(cfg.render_path, engine.capture());
    if (!err.empty()) {
        std::printf("Render failed: %s\n", err.c_str());
        return 1;
    }

    const ViewCamera&   cam = engine.viewport().live();
    const FractalStats& st  = engine.statistics();
    std::printf("%s  %dx%d  center (%.10g, %.10g)  zoom %.6gx  %.1f ms\n",
                fractal_name(engine.fractal()),
                engine.framebuffer().width, engine.framebuffer().height,
                cam.center.re, cam.center.im, cam.zoom, engine.last_render_ms());
    std::printf("area %.4f  escaped %.4f  boundary %lld  dimension %.4f\n",
                st.area_ratio, st.convergence_ratio, st.boundary_points, st.fractal_dimension);
    std::printf("Saved: %s\n", cfg.render_path.c_str());
    return 0;
}
