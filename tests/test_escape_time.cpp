#include "check.hpp"
#include "cpu_renderer.hpp"
#include "escape_time.hpp"
#include "palette.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <set>
#include <utility>

static EscapeResult mandel(Complex c, int max_iter = 256, double radius = 2.0, bool dd = false)
{
    return evaluate_point(FractalKind::Mandelbrot, c, Complex{}, Complex{}, max_iter, radius, dd);
}

static void test_known_points()
{
    std::printf("\nTest: known Mandelbrot points\n");

    check(!mandel({0.0, 0.0}).escaped, "c = 0 stays bounded");
    check(mandel({0.0, 0.0}).iterations == 256, "bounded point reports max_iter");
    check(!mandel({-1.0, 0.0}).escaped, "c = -1 stays bounded");
    check(!mandel({-2.0, 0.0}).escaped, "c = -2 stays bounded (|z| == 2 is not an escape)");

    // z: 0 -> 2 -> 6; |2|^2 == 4 is not > 4, so the test fires at i = 2.
    const EscapeResult two = mandel({2.0, 0.0});
    check(two.escaped && two.iterations == 2, "c = 2 escapes at i = 2");

    const EscapeResult just_over = mandel({2.0001, 0.0});
    check(just_over.escaped && just_over.iterations == 1, "c = 2.0001 escapes at i = 1");

    const EscapeResult far = mandel({10.0, 10.0});
    check(far.escaped && far.iterations == 1, "far point escapes on the first test");

    check(mandel({0.5, 0.0}).escaped, "c = 0.5 escapes");

    check(clamp_iterations(0) == 1, "iterations below 1 clamp to 1");
    check(clamp_iterations(100000) == MAX_ITERATIONS_CAP, "iterations clamp to the cap");
    check(mandel({0.0, 0.0}, 100000).iterations == MAX_ITERATIONS_CAP, "evaluator applies the cap");
}

static void test_monotonicity()
{
    std::printf("\nTest: escape monotonicity\n");

    bool stable = true;
    for (double re = -2.0; re <= 0.5; re += 0.0625) {
        for (double im = 0.0; im <= 1.25; im += 0.0625) {
            const EscapeResult low = mandel({re, im}, 40);
            for (int cap : {41, 100, 1000}) {
                const EscapeResult high = mandel({re, im}, cap);
                if (low.escaped && (!high.escaped || high.iterations != low.iterations)) stable = false;
            }
        }
    }
    check(stable, "a higher cap never changes an escape index");

    bool inside_stays = true;
    for (int cap : {2, 3, 10, 500})
        if (mandel({-1.0, 0.0}, cap).escaped || mandel({0.0, 0.0}, cap).escaped) inside_stays = false;
    check(inside_stays, "c = 0 and c = -1 stay inside for every cap");
}

static void test_julia()
{
    std::printf("\nTest: Julia\n");

    const EscapeResult origin = evaluate_point(FractalKind::Julia, {0.0, 0.0}, {}, {0.0, 0.0},
                                               256, 2.0, false);
    check(!origin.escaped, "c = 0: origin stays at 0");

    const EscapeResult unit = evaluate_point(FractalKind::Julia, {1.0, 0.0}, {}, {0.0, 0.0},
                                             256, 2.0, false);
    check(!unit.escaped, "c = 0: unit circle stays bounded");

    const EscapeResult out = evaluate_point(FractalKind::Julia, {1.01, 0.0}, {}, {0.0, 0.0},
                                            256, 2.0, false);
    check(out.escaped, "c = 0: point outside the unit circle escapes");

    const EscapeResult start = evaluate_point(FractalKind::Julia, {3.0, 0.0}, {}, {-0.7, 0.27015},
                                              256, 2.0, false);
    check(start.escaped && start.iterations == 0, "Julia start outside the radius escapes at i = 0");
}

static void test_compensated()
{
    std::printf("\nTest: compensated precision\n");

    bool same = true;
    const Complex pts[] = {{-0.5, 0.0}, {0.3, 0.5}, {-0.75, 0.1}, {-1.9, 0.0}, {0.26, 0.0}, {2.0, 0.0}};
    for (const Complex& p : pts) {
        const EscapeResult a = mandel(p, 500, 2.0, false);
        const EscapeResult b = mandel(p, 500, 2.0, true);
        if (a.escaped != b.escaped) same = false;
        if (a.escaped && std::abs(a.iterations - b.iterations) > 1) same = false;
    }
    check(same, "double-double agrees with double at moderate depth");

    // Offsets below one ulp of the center are lost in double but kept in double-double.
    const Complex center{-0.75, 0.1};
    const Complex tiny{1e-17, 0.0};
    const EscapeResult std_a = evaluate_point(FractalKind::Mandelbrot, center, tiny, {}, 64, 2.0, false);
    const EscapeResult std_b = evaluate_point(FractalKind::Mandelbrot, center, {}, {}, 64, 2.0, false);
    check(std_a.magnitude_sq == std_b.magnitude_sq, "standard precision drops sub-ulp offsets");

    const EscapeResult dd_a = evaluate_point(FractalKind::Mandelbrot, center, tiny, {}, 64, 2.0, true);
    const EscapeResult dd_b = evaluate_point(FractalKind::Mandelbrot, center, {}, {}, 64, 2.0, true);
    check(dd_a.escaped == dd_b.escaped && std::abs(dd_a.iterations - dd_b.iterations) <= 1,
          "compensated result stays close for a sub-ulp offset");

    // One 64-pixel row at zoom 1e15: neighbouring pixels are ~0.6 ulp apart.
    const Complex deep{-0.743643887037151, 0.131825904205330};
    const int    row_w = 64;
    const double step  = 4.0 / 1e15 / row_w;
    std::set<std::pair<int, double>> std_row, dd_row;
    for (int x = 0; x < row_w; ++x) {
        const Complex off{(x - row_w / 2) * step, 0.0};
        const EscapeResult s = evaluate_point(FractalKind::Mandelbrot, deep, off, {}, 4000, 2.0, false);
        const EscapeResult d = evaluate_point(FractalKind::Mandelbrot, deep, off, {}, 4000, 2.0, true);
        std_row.insert({s.iterations, s.magnitude_sq});
        dd_row.insert({d.iterations, d.magnitude_sq});
    }
    check(static_cast<int>(dd_row.size()) == row_w, "compensated keeps every pixel of a deep row distinct");
    check(static_cast<int>(std_row.size()) < row_w, "standard precision collapses neighbouring deep pixels");
}

static void test_smooth()
{
    std::printf("\nTest: smooth iteration\n");

    const EscapeResult r = mandel({0.5, 0.5}, 256, 2.0);
    check(r.escaped, "sample point escapes");
    const double s = smooth_iteration(r, 2.0);
    check(std::isfinite(s) && s >= 0.0, "smooth value is finite and non-negative");
    check(s > r.iterations - 1.0 && s < r.iterations + 2.0, "smooth value stays near the integer count");

    EscapeResult bad = r;
    bad.magnitude_sq = std::numeric_limits<double>::infinity();
    check(smooth_iteration(bad, 2.0) == bad.iterations, "overflowed |z| falls back to the integer count");
    check(smooth_iteration(r, 1.0) == r.iterations, "radius 1 falls back to the integer count");

    check(escape_value(mandel({0.0, 0.0}), 256, 2.0, true) == 256.0, "inside points report max_iter");
    check(escape_value(r, 256, 2.0, false) == r.iterations, "smooth off gives the integer count");

    EscapeResult late;
    late.escaped      = true;
    late.iterations   = 255;
    late.magnitude_sq = 4.0000001;
    const double v = escape_value(late, 256, 2.0, true);
    check(v < 256.0, "escaped value never reaches max_iter");
    check(escape_color(v, 256, FractalKind::Mandelbrot, 0).r + escape_color(v, 256, FractalKind::Mandelbrot, 0).g > 0.0f,
          "late escapes are still colored");

    // Smooth values are continuous across the integer boundary.
    double max_jump = 0.0;
    double prev     = -1.0;
    for (int i = 0; i <= 200; ++i) {
        const double x   = 0.6 + i * 1e-4;
        const double val = escape_value(mandel({x, 0.5}, 256, 2.0), 256, 2.0, true);
        if (prev >= 0.0) max_jump = std::max(max_jump, std::abs(val - prev));
        prev = val;
    }
    check(max_jump < 1.0, "smooth escape time has no integer steps along a short line");
}

static void test_render()
{
    std::printf("\nTest: escape-time frame\n");

    RenderParams rp;
    rp.kind     = FractalKind::Mandelbrot;
    rp.width    = 64;
    rp.height   = 48;
    rp.camera   = {{-0.5, 0.0}, 1.0, 0.0};
    rp.max_iter = 200;

    CpuRenderer cpu;
    cpu.set_thread_count(2);
    PixelBuffer buf;
    buf.resize(rp.width, rp.height);
    Coverage cov;
    cov.resize(rp.width, rp.height);

    cpu.render(rp, buf, cov);

    check(buf.at(rp.width / 2, rp.height / 2) == 0xFF000000u, "center (-0.5, 0) is black");
    check(cov.at(rp.width / 2, rp.height / 2) == 1.0f, "center is fully inside");

    bool corners_escape = true;
    const int cx[] = {0, rp.width - 1};
    const int cy[] = {0, rp.height - 1};
    for (int x : cx)
        for (int y : cy) {
            const Complex p = screen_to_plane(x + 0.5, y + 0.5, rp.width, rp.height, rp.camera);
            const EscapeResult r = mandel(p, 200);
            if (!r.escaped || r.iterations > 5 || cov.at(x, y) != 0.0f) corners_escape = false;
        }
    check(corners_escape, "corners escape within 5 iterations");
    check(buf.at(0, 0) != 0xFF000000u, "corner pixel is colored");

    PixelBuffer again;
    again.resize(rp.width, rp.height);
    Coverage cov2;
    cov2.resize(rp.width, rp.height);
    cpu.set_thread_count(1);
    cpu.render(rp, again, cov2);
    check(again.pixels == buf.pixels, "identical inputs give identical frames across thread counts");

    rp.samples = 4;
    rp.dither  = 0.01;
    PixelBuffer ss;
    ss.resize(rp.width, rp.height);
    cpu.render(rp, ss, cov2);
    check(ss.at(rp.width / 2, rp.height / 2) == 0xFF000000u, "supersampled interior stays black");
    check(cpu.last_render_ms >= 0.0, "render time recorded");
}

int main()
{
    std::printf("=== escape-time tests ===\n");
    test_known_points();
    test_monotonicity();
    test_julia();
    test_compensated();
    test_smooth();
    test_render();
    return report();
}
