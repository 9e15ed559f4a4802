#pragma once

#include "geometry.hpp"
#include "pixel_buffer.hpp"
#include "stats.hpp"
#include "thread_pool.hpp"
#include "view_state.hpp"

#include <memory>
#include <vector>

class CpuRenderer {
public:
    CpuRenderer();

    // Escape-time frame. `cov` receives the per-pixel inside fraction.
    void render(const RenderParams& rp, PixelBuffer& buf, Coverage& cov);

    // Geometric fractal frame: black background, then segments or triangles.
    void render_geometry(const RenderParams& rp, const std::vector<Segment>& segs,
                         const std::vector<Triangle>& tris, PixelBuffer& buf);

    double last_render_ms = 0.0;
    bool   avx_active     = false;   // true if the AVX path is compiled in and enabled
    int    thread_count   = 0;
    int    hw_concurrency = 0;       // logical CPU count detected at startup

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

    // Override AVX (e.g. for benchmarking the scalar path); ignored without AVX support
    void set_avx(bool b);

private:
    void render_tile(const RenderParams& rp, PixelBuffer& buf, Coverage& cov,
                     int tx, int ty, int tw, int th) const;

    std::unique_ptr<ThreadPool> pool;
    bool avx_supported = false;
    bool use_avx       = false;
};
