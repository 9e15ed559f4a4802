#include "check.hpp"
#include "complex_math.hpp"
#include "double_double.hpp"

#include <cmath>
#include <initializer_list>
#include <limits>

static const double PI = 3.14159265358979323846;

static void test_arithmetic()
{
    std::printf("\nTest: complex arithmetic\n");

    const Complex a{1.5, -2.0};
    const Complex b{-0.5, 4.0};

    const Complex s = add(a, b);
    check(s.re == 1.0 && s.im == 2.0, "add is component-wise");

    const Complex d = sub(a, b);
    check(d.re == 2.0 && d.im == -6.0, "sub is component-wise");

    const Complex m = mul({0.0, 1.0}, {0.0, 1.0});
    check(m.re == -1.0 && m.im == 0.0, "i * i == -1");

    const Complex q = div(mul(a, b), b);
    check(near(q.re, a.re) && near(q.im, a.im), "(a * b) / b == a");

    check(magnitude_squared({3.0, 4.0}) == 25.0, "|3+4i|^2 == 25");

    const Complex z = div({1.0, 1.0}, {0.0, 0.0});
    check(!is_finite(z), "division by zero is not finite");
    check(is_finite(a), "ordinary value is finite");
    check(!is_finite({std::numeric_limits<double>::quiet_NaN(), 0.0}), "NaN component is not finite");

    const Complex r = rotate({1.0, 0.0}, PI / 2.0);
    check(near(r.re, 0.0) && near(r.im, 1.0), "rotate by pi/2 is counter-clockwise");

    const Vec2 v = Mat2::rotation(PI).apply({1.0, 2.0});
    check(near(v.x, -1.0) && near(v.y, -2.0), "Mat2 rotation by pi negates");

    const Vec2 mid = lerp({0.0, 0.0}, {2.0, 4.0}, 0.5);
    check(mid.x == 1.0 && mid.y == 2.0, "lerp midpoint");
}

static void test_screen_mapping()
{
    std::printf("\nTest: screen <-> plane mapping\n");

    const double W = 800.0, H = 600.0;

    ViewCamera cam;
    cam.center = {-0.5, 0.0};
    cam.zoom   = 1.0;

    const Complex c = screen_to_complex(W / 2.0, H / 2.0, W, H, cam);
    check(near(c.re, -0.5) && near(c.im, 0.0), "screen center maps to view center");

    const Complex top = screen_to_complex(W / 2.0, 0.0, W, H, cam);
    check(near(top.im, 2.0), "top edge is center + 2 at zoom 1");

    const Complex left = screen_to_complex(0.0, H / 2.0, W, H, cam);
    check(near(left.re, -0.5 - 2.0 * W / H), "left edge scales with aspect ratio");

    cam.zoom = 4.0;
    const Complex top4 = screen_to_complex(W / 2.0, 0.0, W, H, cam);
    check(near(top4.im, 0.5), "visible height is 4 / zoom");

    const ViewCamera cams[] = {
        {{-0.5, 0.0}, 1.0, 0.0},
        {{0.3, -0.7}, 250.0, 0.0},
        {{-1.25066, 0.02012}, 2000.0, 0.0},
        {{0.1, 0.2}, 0.01, 0.0},
    };
    bool round_trip = true;
    for (const ViewCamera& k : cams) {
        for (double x : {0.0, 13.0, 400.0, 799.0}) {
            for (double y : {0.0, 77.0, 599.0}) {
                const Vec2 p = complex_to_screen(screen_to_complex(x, y, W, H, k), W, H, k);
                if (!near(p.x, x, 1e-6) || !near(p.y, y, 1e-6)) round_trip = false;
            }
        }
    }
    check(round_trip, "complex_to_screen inverts screen_to_complex");

    bool rotated_round_trip = true;
    for (double rot : {0.0, 0.3, -1.2, PI}) {
        const ViewCamera k{{0.25, -0.1}, 37.0, rot};
        for (double x : {0.0, 250.0, 799.0}) {
            for (double y : {10.0, 300.0, 590.0}) {
                const Vec2 p = plane_to_screen(screen_to_plane(x, y, W, H, k), W, H, k);
                if (!near(p.x, x, 1e-6) || !near(p.y, y, 1e-6)) rotated_round_trip = false;
            }
        }
    }
    check(rotated_round_trip, "plane_to_screen inverts screen_to_plane under rotation");

    const ViewCamera flat{{0.25, -0.1}, 37.0, 0.0};
    const Complex p0 = screen_to_plane(123.0, 456.0, W, H, flat);
    const Complex p1 = screen_to_complex(123.0, 456.0, W, H, flat);
    check(p0.re == p1.re && p0.im == p1.im, "unrotated plane mapping equals complex mapping");

    const ViewCamera quarter{{0.0, 0.0}, 1.0, PI / 2.0};
    const Complex right = screen_to_plane(W / 2.0 + 100.0, H / 2.0, W, H, quarter);
    check(near(right.re, 0.0, 1e-9) && right.im < 0.0,
          "screen right maps to -im after a quarter turn");
}

static void test_double_double()
{
    std::printf("\nTest: double-double\n");

    const DD s = two_sum(1.0, 1e-20);
    check(s.hi == 1.0 && s.lo == 1e-20, "two_sum keeps the rounding error");

    const DD p = two_prod(1.0 + 1e-10, 1.0 - 1e-10);
    check(p.hi + p.lo == p.hi && near(p.hi, 1.0, 1e-15), "two_prod splits the product");

    const DDComplex o = dd_offset({-0.75, 0.1}, {1e-18, -1e-18});
    check(o.re.hi == -0.75 && o.re.lo == 1e-18, "dd_offset stores sub-ulp offsets in the low word");

    const DDComplex a = dd_offset({1.0, 0.0}, {1e-17, 0.0});
    const DDComplex b = dd_offset({1.0, 0.0}, {2e-17, 0.0});
    check(a.re.hi == b.re.hi && a.re.lo != b.re.lo,
          "neighbouring deep-zoom samples stay distinct");

    const DD x{3.0, 0.0};
    const DD y = dd_sub(dd_mul(x, x), DD{9.0, 0.0});
    check(y.hi == 0.0 && y.lo == 0.0, "3 * 3 - 9 == 0");

    const DDComplex z = dd_square({{0.0, 0.0}, {1.0, 0.0}});
    check(dd_to_double(z.re) == -1.0 && dd_to_double(z.im) == 0.0, "i^2 == -1 in double-double");
}

int main()
{
    std::printf("=== complex_math / double_double tests ===\n");
    test_arithmetic();
    test_screen_mapping();
    test_double_double();
    return report();
}
