#include "check.hpp"
#include "escape_time.hpp"
#include "quality_policy.hpp"

static void test_precision()
{
    std::printf("\nTest: precision selection\n");

    check(!use_compensated(20.0, PrecisionMode::Auto), "auto: zoom 20 stays in double");
    check(use_compensated(20.5, PrecisionMode::Auto), "auto: zoom above 20 switches to double-double");
    check(!use_compensated(1e9, PrecisionMode::Standard), "standard never compensates");
    check(use_compensated(1.0, PrecisionMode::Compensated), "compensated always compensates");
}

static void test_supersampling()
{
    std::printf("\nTest: supersampling\n");

    check(supersample_side(1.0, 1.0) == 1, "zoom 1: single sample");
    check(supersample_side(100.0, 1.0) == 1, "zoom 100: single sample");
    check(supersample_side(101.0, 1.0) == 4, "zoom above 1e2: 4x4");
    check(supersample_side(5e3, 1.0) == 6, "zoom above 1e3: 6x6");
    check(supersample_side(5e4, 1.0) == 8, "zoom above 1e4: 8x8");
    check(supersample_side(5e5, 1.0) == 12, "zoom above 1e5: 12x12");
    check(supersample_side(5e4, 2.0) == 8, "render scale 2 keeps the grid");
    check(supersample_side(5e3, 3.0) == 9, "render scale above 2 grows the grid");
    check(supersample_side(5e5, 4.0) == MAX_SAMPLE_SIDE, "grid side capped at 16");
    check(supersample_side(1.0, 0.5) == 1, "small render scale never drops below 1");
}

static void test_radius_and_hint()
{
    std::printf("\nTest: escape radius and iteration hint\n");

    check(effective_escape_radius(2.0, 1e4) == 2.0, "radius unchanged up to zoom 1e4");
    check(effective_escape_radius(2.0, 2e4) == 3.0, "radius boosted by 1.5 past 1e4");
    check(effective_escape_radius(8.0, 2e4) == 10.0, "boost capped at 10");
    check(effective_escape_radius(20.0, 2e4) == 20.0, "large radius left alone");

    check(iteration_hint(100.0, 1, 1.0) == 0, "no hint at zoom 100");
    check(iteration_hint(500.0, 256, 1.0) == 0, "no hint when iterations already suffice");
    check(iteration_hint(500.0, 5, 1.0) == 1500, "zoom 500: 3x zoom");
    check(iteration_hint(5000.0, 50, 1.0) == 7500, "zoom 5e3: 1.5x zoom");
    check(iteration_hint(5e4, 256, 1.0) == 8000, "hint capped at the iteration cap");
    check(iteration_hint(5000.0, 50, 0.5) == 3750, "hint scales with render scale");
}

static void test_decision()
{
    std::printf("\nTest: quality decision\n");

    QualitySettings s;
    s.max_iterations = 300;

    const QualityDecision home = decide_quality(1.0, s);
    check(home.iterations == 300, "iterations are the user's");
    check(!home.compensated && home.samples == 1 && home.dither == 0.0, "zoom 1: plain frame");
    check(!home.extreme_zoom, "zoom 1 is not extreme");

    const QualityDecision deep = decide_quality(2e6, s);
    check(deep.iterations == 300, "policy never changes iterations");
    check(deep.compensated && deep.samples == 12, "deep zoom: compensated and 12x12");
    check(deep.dither == DITHER_AMPLITUDE, "dither above zoom 5");
    check(deep.escape_radius == 3.0, "deep zoom boosts the radius");
    check(deep.extreme_zoom, "zoom above 1e6 flagged");
    check(deep.iteration_hint == MAX_ITERATIONS_CAP, "deep zoom suggests more iterations");

    s.max_iterations = 0;
    check(decide_quality(1.0, s).iterations == 1, "iterations clamped to at least 1");

    check(decide_quality(5.0, QualitySettings{}).dither == 0.0, "no dither at zoom 5");
}

static void test_hashes()
{
    std::printf("\nTest: sample pattern\n");

    bool in_range = true;
    bool stable   = true;
    for (int px = 0; px < 20; ++px) {
        for (int py = 0; py < 20; ++py) {
            const double h = jitter_hash(px, py, 3.0);
            if (h < 0.0 || h >= 1.0) in_range = false;
            if (h != jitter_hash(px, py, 3.0)) stable = false;
            const double d = dither_offset(px, py, 0.01);
            if (d < -0.005 || d > 0.005) in_range = false;
        }
    }
    check(in_range, "hash in [0, 1), dither within half the amplitude");
    check(stable, "hash is deterministic");

    const Vec2 single = sample_offset(5, 7, 0, 0, 1);
    check(single.x == 0.0 && single.y == 0.0, "single sample sits at the pixel center");

    bool inside_pixel = true;
    const int n = 4;
    for (int sy = 0; sy < n; ++sy)
        for (int sx = 0; sx < n; ++sx) {
            const Vec2 o = sample_offset(9, 3, sx, sy, n);
            if (o.x < -0.5 - 0.1 / n || o.x > 0.5 || o.y < -0.5 - 0.1 / n || o.y > 0.5) inside_pixel = false;
        }
    check(inside_pixel, "jittered grid stays within the pixel");
    check(dither_offset(3, 4, 0.0) == 0.0, "zero amplitude gives zero dither");
}

int main()
{
    std::printf("=== quality policy tests ===\n");
    test_precision();
    test_supersampling();
    test_radius_and_hint();
    test_decision();
    test_hashes();
    return report();
}
