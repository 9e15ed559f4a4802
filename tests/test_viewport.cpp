#include "check.hpp"
#include "viewport.hpp"

#include <cmath>
#include <initializer_list>
#include <limits>

static const double W = 800.0;
static const double H = 600.0;

static void test_damping()
{
    std::printf("\nTest: damping\n");

    check(near(damping_alpha(REFERENCE_TICK), ANIMATION_SPEED, 1e-12), "one reference tick moves 15%");
    check(damping_alpha(0.0) == ANIMATION_SPEED, "dt == 0 counts as one tick");
    check(damping_alpha(-1.0) == ANIMATION_SPEED, "negative dt counts as one tick");

    // Two half ticks cover the same distance as one full tick.
    const double half = damping_alpha(REFERENCE_TICK / 2.0);
    const double two_halves = 1.0 - (1.0 - half) * (1.0 - half);
    check(near(two_halves, ANIMATION_SPEED, 1e-12), "damping is frame-rate independent");

    const ViewCamera live{{0.0, 0.0}, 1.0, 0.0};
    const ViewCamera target{{1.0, 0.0}, 1.0, 0.0};
    const ViewCamera next = step_camera(live, target, ANIMATION_SPEED);
    check(near(next.center.re, 0.15, 1e-15), "step moves 15% of the remaining distance");
    check(next.zoom == 1.0 && next.rotation == 0.0, "settled fields stay exact");

    const ViewCamera close{{1.0 - 1e-9, 0.0}, 1.0, 0.0};
    check(step_camera(close, target, ANIMATION_SPEED).center.re == 1.0, "field within epsilon snaps");
    check(step_camera(live, target, 0.0).center.re == 0.0, "alpha 0 leaves the camera in place");
}

static void test_convergence()
{
    std::printf("\nTest: animation convergence\n");

    Viewport vp(ViewCamera{{-0.5, 0.0}, 1.0, 0.0});
    check(vp.settled(), "fresh viewport is settled");
    check(!vp.update(), "update on a settled viewport reports no animation");

    vp.set_target({0.3, -0.2}, 50.0, 0.5);
    check(!vp.settled(), "new target starts an animation");
    check(vp.live().zoom == 1.0, "set_target leaves the live camera alone");

    int ticks = 0;
    while (vp.update() && ticks < 1000) ++ticks;
    check(ticks < 200, "converges within 200 ticks");
    check(vp.settled(), "settled after convergence");
    check(cameras_equal(vp.live(), vp.target()), "live equals target exactly once settled");

    const ViewCamera before = vp.live();
    vp.update();
    check(cameras_equal(before, vp.live()), "update after settling is a no-op");

    // Zoom moves monotonically toward its target.
    vp.set_target(vp.target().center, 5000.0, vp.target().rotation);
    double last = vp.live().zoom;
    bool monotonic = true;
    while (vp.update()) {
        if (vp.live().zoom < last) monotonic = false;
        last = vp.live().zoom;
    }
    check(monotonic, "zoom never overshoots while animating in");

    // Steps below one ulp of a large zoom snap instead of stalling.
    Viewport deep(ViewCamera{{-0.5, 0.0}, 1.0, 0.0});
    deep.set_target({-0.5, 0.0}, 1e15, 0.0);
    int deep_ticks = 0;
    while (deep.update() && deep_ticks < 5000) ++deep_ticks;
    check(deep.settled() && deep.live().zoom == 1e15, "zoom 1 -> 1e15 settles exactly");
    check(deep_ticks > 200 && deep_ticks < 300, "settle time grows with the size of the zoom jump");
}

static void test_target_validation()
{
    std::printf("\nTest: target validation\n");

    Viewport vp;
    vp.set_target({0.0, 0.0}, 1e-9, 0.0);
    check(vp.target().zoom == MIN_ZOOM, "zoom clamped to the minimum");

    vp.set_target({1.0, 1.0}, 2.0, 0.0);
    const ViewCamera good = vp.target();
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    vp.set_target({nan, 0.0}, 3.0, 0.0);
    vp.set_target({0.0, 0.0}, inf, 0.0);
    vp.set_target({0.0, 0.0}, 3.0, nan);
    check(cameras_equal(vp.target(), good), "non-finite targets are ignored");

    vp.jump_to({{0.5, 0.5}, 8.0, 0.25});
    check(vp.settled() && vp.live().zoom == 8.0, "jump_to moves live and target together");

    vp.reset({-0.5, 0.0});
    check(vp.target().center.re == -0.5 && vp.target().zoom == 1.0 && vp.target().rotation == 0.0,
          "reset targets (center, 1, 0)");
}

static void test_zoom_at()
{
    std::printf("\nTest: zoom_at keeps the cursor point fixed\n");

    bool fixed = true;
    for (double rot : {0.0, 0.7}) {
        Viewport vp;
        vp.jump_to({{-0.5, 0.1}, 3.0, rot});
        for (double f : {1.25, 0.8, 10.0}) {
            for (double sx : {0.0, 200.0, 799.0}) {
                for (double sy : {0.0, 300.0, 599.0}) {
                    vp.jump_to(vp.target());
                    const Complex before = screen_to_plane(sx, sy, W, H, vp.target());
                    vp.zoom_at(f, sx, sy, W, H);
                    const Complex after = screen_to_plane(sx, sy, W, H, vp.target());
                    const double tol = 1e-12 * (1.0 + 4.0 / vp.target().zoom);
                    if (!near(before.re, after.re, tol) || !near(before.im, after.im, tol)) fixed = false;
                }
            }
        }
    }
    check(fixed, "plane point under the cursor unchanged");

    Viewport vp;
    vp.zoom_at(2.0, W / 2.0, H / 2.0, W, H);
    check(vp.target().zoom == 2.0, "factor multiplies the target zoom");
    check(vp.live().zoom == 1.0, "zoom_at only moves the target");

    vp.zoom_at(1e-12, 100.0, 100.0, W, H);
    check(vp.target().zoom == MIN_ZOOM, "zoom_at respects the minimum zoom");

    const ViewCamera before = vp.target();
    vp.zoom_at(0.0, 10.0, 10.0, W, H);
    vp.zoom_at(-2.0, 10.0, 10.0, W, H);
    vp.zoom_at(2.0, 10.0, 10.0, 0.0, H);
    check(cameras_equal(before, vp.target()), "invalid factors and surfaces are ignored");
}

static void test_pan()
{
    std::printf("\nTest: pan\n");

    Viewport vp;
    vp.jump_to({{0.0, 0.0}, 1.0, 0.0});
    vp.pan(80.0, 0.0, W, H);
    const double expected = -(80.0 / W) * 4.0 * (W / H);
    check(near(vp.target().center.re, expected), "positive dx moves the center left");
    check(vp.target().center.im == 0.0, "horizontal drag leaves im alone");

    vp.jump_to({{0.0, 0.0}, 2.0, 0.0});
    vp.pan(0.0, 60.0, W, H);
    check(near(vp.target().center.im, (60.0 / H) * 2.0), "pan distance scales with 1 / zoom");

    // Dragging by the screen distance between two points brings the second
    // point under the first, rotated or not.
    vp.jump_to({{0.2, -0.3}, 5.0, 0.9});
    const Complex grabbed = screen_to_plane(500.0, 200.0, W, H, vp.live());
    vp.pan(-100.0, 50.0, W, H);
    vp.jump_to(vp.target());
    const Complex under = screen_to_plane(400.0, 250.0, W, H, vp.live());
    check(near(grabbed.re, under.re, 1e-12) && near(grabbed.im, under.im, 1e-12),
          "rotated pan follows the pointer");

    vp.rotate(0.1);
    check(near(vp.target().rotation, 1.0, 1e-12), "rotate adds to the target rotation");
}

static void test_shader_params()
{
    std::printf("\nTest: shader params\n");

    Viewport vp;
    vp.jump_to({{-0.5, 0.0}, 4.0, 0.0});
    const ShaderParams sp = vp.shader_params(W, H);
    check(sp.range == 1.0, "range is 4 / zoom");
    check(near(sp.aspect, W / H), "aspect is w / h");
    check(sp.center.re == -0.5, "center is the live center");
}

int main()
{
    std::printf("=== viewport tests ===\n");
    test_damping();
    test_convergence();
    test_target_validation();
    test_zoom_at();
    test_pan();
    test_shader_params();
    return report();
}
