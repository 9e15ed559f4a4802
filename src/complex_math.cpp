#include "complex_math.hpp"

Complex screen_to_complex(double x, double y, double w, double h, const ViewCamera& cam)
{
    const double aspect = w / h;
    const double range  = 4.0 / cam.zoom;
    return {
        (x / w - 0.5) * range * aspect + cam.center.re,
        (0.5 - y / h) * range          + cam.center.im,
    };
}

Vec2 complex_to_screen(Complex c, double w, double h, const ViewCamera& cam)
{
    const double aspect = w / h;
    const double range  = 4.0 / cam.zoom;
    return {
        ((c.re - cam.center.re) / (range * aspect) + 0.5) * w,
        (0.5 - (c.im - cam.center.im) / range) * h,
    };
}

Complex screen_to_plane(double x, double y, double w, double h, const ViewCamera& cam)
{
    const double aspect = w / h;
    const double range  = 4.0 / cam.zoom;
    Complex off{(x / w - 0.5) * range * aspect, (0.5 - y / h) * range};
    if (cam.rotation != 0.0)
        off = rotate(off, -cam.rotation);
    return add(cam.center, off);
}

Vec2 plane_to_screen(Complex c, double w, double h, const ViewCamera& cam)
{
    const double aspect = w / h;
    const double range  = 4.0 / cam.zoom;
    Complex off = sub(c, cam.center);
    if (cam.rotation != 0.0)
        off = rotate(off, cam.rotation);
    return {
        (off.re / (range * aspect) + 0.5) * w,
        (0.5 - off.im / range) * h,
    };
}
