#include "check.hpp"
#include "input_controller.hpp"

#include <initializer_list>

static const double W = 800.0;
static const double H = 600.0;

static void test_pointer()
{
    std::printf("\nTest: pointer drag\n");

    Viewport vp;
    vp.jump_to({{0.0, 0.0}, 1.0, 0.0});
    InputController in(vp);
    in.set_fractal(FractalKind::Mandelbrot);
    in.set_surface(W, H);

    in.pointer_down(100.0, 100.0);
    in.pointer_move(101.0, 100.5);
    check(!in.dragging(), "movement of 1 px is not a drag");
    check(vp.target().center.re == 0.0 && vp.target().center.im == 0.0, "sub-threshold move does not pan");

    in.pointer_move(150.0, 100.0);
    check(in.dragging(), "movement beyond 1 px starts a drag");
    check(vp.target().center.re < 0.0, "dragging right moves the Mandelbrot center left");

    const double zoom = vp.target().zoom;
    in.pointer_up();
    check(!in.dragging(), "release ends the drag");
    check(vp.target().zoom == zoom, "release never zooms");

    const Complex c = vp.target().center;
    in.pointer_move(300.0, 300.0);
    check(vp.target().center.re == c.re, "moving without a press does not pan");

    Viewport gv;
    gv.jump_to({{0.0, 0.0}, 1.0, 0.0});
    InputController gin(gv);
    gin.set_fractal(FractalKind::Koch);
    gin.set_surface(W, H);
    gin.pointer_down(100.0, 100.0);
    gin.pointer_move(150.0, 100.0);
    check(gv.target().center.re > 0.0, "geometric fractals pan the other way");
}

static void test_multipliers()
{
    std::printf("\nTest: pan multipliers\n");

    const PanMultipliers m = pan_multipliers(FractalKind::Mandelbrot);
    const PanMultipliers j = pan_multipliers(FractalKind::Julia);
    check(m.x == 1.0 && m.y == 1.0 && j.x == 1.0 && j.y == 1.0, "escape-time kinds use +1");

    bool inverted = true;
    for (FractalKind k : {FractalKind::Koch, FractalKind::Sierpinski, FractalKind::Tree}) {
        const PanMultipliers g = pan_multipliers(k);
        if (g.x != -1.0 || g.y != -1.0) inverted = false;
    }
    check(inverted, "geometric kinds use -1");
}

static void test_wheel()
{
    std::printf("\nTest: wheel\n");

    Viewport vp;
    InputController in(vp);
    in.set_surface(W, H);

    in.wheel(-1.0, W / 2.0, H / 2.0);
    check(near(vp.target().zoom, WHEEL_ZOOM_IN), "wheel up zooms in by 1.25");

    in.wheel(1.0, W / 2.0, H / 2.0);
    check(near(vp.target().zoom, WHEEL_ZOOM_IN * WHEEL_ZOOM_OUT), "wheel down zooms out by 0.8");

    in.wheel(0.0, W / 2.0, H / 2.0);
    check(near(vp.target().zoom, WHEEL_ZOOM_IN * WHEEL_ZOOM_OUT * WHEEL_ZOOM_IN), "zero delta zooms in");

    vp.jump_to({{0.0, 0.0}, 1.0, 0.0});
    const Complex before = screen_to_plane(650.0, 120.0, W, H, vp.target());
    in.wheel(-1.0, 650.0, 120.0);
    const Complex after = screen_to_plane(650.0, 120.0, W, H, vp.target());
    check(near(before.re, after.re, 1e-12) && near(before.im, after.im, 1e-12),
          "wheel zoom is anchored at the pointer");
}

static void test_touch()
{
    std::printf("\nTest: touch\n");

    Viewport vp;
    vp.jump_to({{0.0, 0.0}, 2.0, 0.0});
    InputController in(vp);
    in.set_fractal(FractalKind::Julia);
    in.set_surface(W, H);

    Vec2 start[2] = {{300.0, 300.0}, {500.0, 300.0}};
    in.touch_start(2, start);
    Vec2 spread[2] = {{200.0, 300.0}, {600.0, 300.0}};
    in.touch_move(2, spread);
    check(near(vp.target().zoom, 4.0), "pinch to twice the distance doubles the start zoom");

    Vec2 back[2] = {{350.0, 300.0}, {450.0, 300.0}};
    in.touch_move(2, back);
    check(near(vp.target().zoom, 1.0), "pinch zoom tracks the start distance, not the last move");

    in.touch_end();
    vp.jump_to(vp.target());

    const Complex c = vp.target().center;
    Vec2 one[1] = {{100.0, 100.0}};
    in.touch_start(1, one);
    Vec2 moved[1] = {{100.0, 160.0}};
    in.touch_move(1, moved);
    check(vp.target().center.im > c.im, "one finger pans like a pointer");
    in.touch_end();
    check(!in.dragging(), "touch end clears the drag");
}

static void test_keys()
{
    std::printf("\nTest: keyboard\n");

    Viewport vp;
    vp.jump_to({{0.0, 0.0}, 1.0, 0.0});
    InputController in(vp);
    in.set_fractal(FractalKind::Mandelbrot);
    in.set_surface(W, H);

    check(!in.poll(), "nothing held, nothing moves");

    in.key_down(Key::Right, false, false);
    check(in.poll(), "held arrow reports movement");
    check(near(vp.target().center.re, KEY_PAN_SPEED), "right arrow moves +re by 0.02 at zoom 1");
    in.key_up(Key::Right);

    in.key_down(Key::W, false, false);
    in.poll();
    check(near(vp.target().center.im, KEY_PAN_SPEED), "W moves +im");
    in.key_up(Key::W);

    vp.jump_to({{0.0, 0.0}, 4.0, 0.0});
    in.key_down(Key::A, false, false);
    in.poll();
    check(near(vp.target().center.re, -KEY_PAN_SPEED / 4.0), "pan speed scales with 1 / zoom");
    in.key_up(Key::A);

    in.key_down(Key::E, false, false);
    in.poll();
    check(near(vp.target().rotation, KEY_ROTATE_SPEED), "E rotates counter-clockwise");
    in.key_up(Key::E);
    in.key_down(Key::Q, false, false);
    in.poll();
    in.poll();
    check(near(vp.target().rotation, -KEY_ROTATE_SPEED), "Q rotates clockwise each poll");

    in.release_all_keys();
    check(!in.poll(), "release_all_keys clears held keys");

    vp.jump_to({{0.0, 0.0}, 1.0, 0.0});
    in.key_down(Key::Equal, true, false);
    in.key_down(Key::Equal, true, true);
    in.key_down(Key::Equal, true, true);
    check(near(vp.target().zoom, KEY_ZOOM_IN), "Ctrl+= fires once per press");
    in.key_up(Key::Equal);

    in.key_down(Key::NumpadSubtract, true, false);
    check(near(vp.target().zoom, KEY_ZOOM_IN * KEY_ZOOM_OUT), "Ctrl+numpad- zooms out");
    in.key_up(Key::NumpadSubtract);

    in.key_down(Key::Equal, false, false);
    check(near(vp.target().zoom, KEY_ZOOM_IN * KEY_ZOOM_OUT), "= without Ctrl is not a shortcut");
    in.key_up(Key::Equal);

    vp.jump_to({{1.0, 1.0}, 30.0, 0.4});
    in.key_down(Key::R, true, false);
    check(vp.target().center.re == -0.5 && vp.target().center.im == 0.0 &&
          vp.target().zoom == 1.0 && vp.target().rotation == 0.0,
          "Ctrl+R resets to the Mandelbrot home view");
    in.key_up(Key::R);

    in.set_fractal(FractalKind::Tree);
    vp.jump_to({{1.0, 1.0}, 30.0, 0.4});
    in.key_down(Key::R, true, false);
    check(vp.target().center.re == 0.0 && vp.target().center.im == 0.0,
          "reset center follows the active fractal");
    in.key_up(Key::R);
}

int main()
{
    std::printf("=== input controller tests ===\n");
    test_pointer();
    test_multipliers();
    test_wheel();
    test_touch();
    test_keys();
    return report();
}
