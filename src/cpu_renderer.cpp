#include "cpu_renderer.hpp"
#include "escape_time.hpp"
#include "palette.hpp"
#include "quality_policy.hpp"
#include "rasterizer.hpp"

#ifdef HAVE_SLEEF
#include "cpu_renderer_avx.hpp"
#endif

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

// -----------------------------------------------------------------------
// Constructor: detect AVX, build thread pool
// -----------------------------------------------------------------------
CpuRenderer::CpuRenderer()
{
#ifdef HAVE_SLEEF
    avx_supported = __builtin_cpu_supports("avx");
#endif
    use_avx    = avx_supported;
    avx_active = use_avx;

    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    thread_count   = n;
    pool = std::make_unique<ThreadPool>(n);
}

void CpuRenderer::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    if (n == thread_count && pool) return;
    pool = std::make_unique<ThreadPool>(n);
    thread_count = n;
}

void CpuRenderer::set_avx(bool b)
{
    use_avx    = b && avx_supported;
    avx_active = use_avx;
}

// -----------------------------------------------------------------------
// Tile renderer: called from thread pool workers
//
// Each sample sits at (px + 0.5 + ox, py + 0.5 + oy). Its plane offset from
// the view center is turned by -rotation, then added to the center in the
// evaluator so compensated mode can keep the sum exact.
// -----------------------------------------------------------------------
void CpuRenderer::render_tile(const RenderParams& rp, PixelBuffer& buf, Coverage& cov,
                              int tx, int ty, int tw, int th) const
{
    const int    W      = buf.width;
    const int    H      = buf.height;
    const double aspect = static_cast<double>(W) / H;
    const double range  = 4.0 / rp.camera.zoom;
    const double cs     = std::cos(-rp.camera.rotation);
    const double sn     = std::sin(-rp.camera.rotation);
    const bool   rotated = rp.camera.rotation != 0.0;
    const int    N      = std::max(1, rp.samples);
    const double inv_ss = 1.0 / (N * N);

    auto plane_offset = [&](double sx, double sy) -> Complex {
        Complex off{(sx / W - 0.5) * range * aspect, (0.5 - sy / H) * range};
        if (rotated)
            off = {off.re * cs - off.im * sn, off.re * sn + off.im * cs};
        return off;
    };

    auto shade = [&](double value) -> Rgb {
        return escape_color(value, rp.max_iter, rp.kind, rp.scheme);
    };

    auto store = [&](int px, int py, Rgb sum, int inside) {
        Rgb c = sum;
        if (inside < N * N && rp.dither != 0.0) {
            const float d = static_cast<float>(dither_offset(px, py, rp.dither));
            c = {std::clamp(c.r + d, 0.0f, 1.0f),
                 std::clamp(c.g + d, 0.0f, 1.0f),
                 std::clamp(c.b + d, 0.0f, 1.0f)};
        }
        buf.at(px, py) = pack_rgba(c);
        cov.inside[static_cast<size_t>(py) * W + px] = static_cast<float>(inside * inv_ss);
    };

    const bool fast_rows = use_avx && N == 1 && !rp.compensated && !rotated;

    for (int py = ty; py < ty + th && py < H; ++py) {
        int       px  = tx;
        const int end = std::min(tx + tw, W);

#ifdef HAVE_SLEEF
        // --- AVX path: 4 pixels per iteration ---
        if (fast_rows) {
            const double scale = range * aspect / W;
            const double im    = rp.camera.center.im + plane_offset(0.0, py + 0.5).im;
            for (; px + 4 <= end; px += 4) {
                const double re0 = rp.camera.center.re + plane_offset(px + 0.5, 0.0).re;
                double value4[4];
                int    escaped4[4];
                if (rp.kind == FractalKind::Julia)
                    avx_julia_4(re0, scale, im, rp.julia_c.re, rp.julia_c.im,
                                rp.max_iter, rp.escape_radius, rp.smooth, value4, escaped4);
                else
                    avx_mandelbrot_4(re0, scale, im,
                                     rp.max_iter, rp.escape_radius, rp.smooth, value4, escaped4);
                for (int k = 0; k < 4; ++k)
                    store(px + k, py, shade(value4[k]), escaped4[k] ? 0 : 1);
            }
        }
#else
        (void)fast_rows;
#endif

        // --- Scalar path: remainder pixels, supersampled or compensated frames ---
        for (; px < end; ++px) {
            Rgb sum;
            int inside = 0;
            for (int sy = 0; sy < N; ++sy) {
                for (int sx = 0; sx < N; ++sx) {
                    const Vec2    o   = sample_offset(px, py, sx, sy, N);
                    const Complex off = plane_offset(px + 0.5 + o.x, py + 0.5 + o.y);
                    const EscapeResult r = evaluate_point(rp.kind, rp.camera.center, off,
                                                          rp.julia_c, rp.max_iter,
                                                          rp.escape_radius, rp.compensated);
                    if (!r.escaped) {
                        ++inside;
                        continue;
                    }
                    const Rgb c = shade(escape_value(r, rp.max_iter, rp.escape_radius, rp.smooth));
                    sum.r += c.r; sum.g += c.g; sum.b += c.b;
                }
            }
            const float k = static_cast<float>(inv_ss);
            store(px, py, {sum.r * k, sum.g * k, sum.b * k}, inside);
        }
    }
}

// -----------------------------------------------------------------------
// Top-level render: splits image into tiles and dispatches to thread pool
// -----------------------------------------------------------------------
void CpuRenderer::render(const RenderParams& rp, PixelBuffer& buf, Coverage& cov)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    const int W = buf.width, H = buf.height;
    if (W <= 0 || H <= 0) return;
    if (cov.width != W || cov.height != H) cov.resize(W, H);

    constexpr int TILE_W = 64;
    constexpr int TILE_H = 64;
    const int tiles_x = (W + TILE_W - 1) / TILE_W;
    const int tiles_y = (H + TILE_H - 1) / TILE_H;

    pool->parallel_for(tiles_x * tiles_y, [&](int t) {
        const int tx = (t % tiles_x) * TILE_W;
        const int ty = (t / tiles_x) * TILE_H;
        render_tile(rp, buf, cov, tx, ty, std::min(TILE_W, W - tx), std::min(TILE_H, H - ty));
    });

    last_render_ms = std::chrono::duration<double, std::milli>(
                         clock::now() - t0).count();
}

void CpuRenderer::render_geometry(const RenderParams& rp, const std::vector<Segment>& segs,
                                  const std::vector<Triangle>& tris, PixelBuffer& buf)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    if (buf.empty()) return;
    buf.clear();

    ShaderParams sp;
    sp.center   = rp.camera.center;
    sp.zoom     = rp.camera.zoom;
    sp.rotation = rp.camera.rotation;
    sp.aspect   = static_cast<double>(buf.width) / buf.height;
    sp.range    = 4.0 / rp.camera.zoom;
    const GeometryTransform xf = make_geometry_transform(sp, buf.width, buf.height);

    constexpr double LINE_WIDTH = 1.5;
    if (!tris.empty())
        fill_triangles(tris, xf, rp.kind, rp.scheme, buf);
    if (!segs.empty())
        draw_segments(segs, xf, rp.kind, rp.scheme, LINE_WIDTH, buf);

    last_render_ms = std::chrono::duration<double, std::milli>(
                         clock::now() - t0).count();
}
