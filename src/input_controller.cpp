#include "input_controller.hpp"

#include <cmath>

PanMultipliers pan_multipliers(FractalKind kind)
{
    if (is_escape_time(kind)) return {1.0, 1.0};
    return {-1.0, -1.0};
}

void InputController::set_fractal(FractalKind kind)
{
    pan_mult     = pan_multipliers(kind);
    reset_center = default_center(kind);
}

// ---------------------------------------------------------------------------
// Pointer: a move only counts as a drag once it exceeds the threshold in
// either axis. Releasing never zooms.
// ---------------------------------------------------------------------------
void InputController::pointer_down(double x, double y)
{
    pointer_is_down = true;
    is_dragging     = false;
    last_x          = x;
    last_y          = y;
}

void InputController::pointer_move(double x, double y)
{
    if (pointer_is_down) {
        const double dx = x - last_x;
        const double dy = y - last_y;
        if (std::abs(dx) > DRAG_THRESHOLD_PX || std::abs(dy) > DRAG_THRESHOLD_PX) {
            is_dragging = true;
            viewport.pan(dx * pan_mult.x, dy * pan_mult.y, width, height);
        }
    }
    last_x = x;
    last_y = y;
}

void InputController::pointer_up()
{
    pointer_is_down = false;
    is_dragging     = false;
}

void InputController::wheel(double wheel_dy, double x, double y)
{
    const double factor = wheel_dy > 0.0 ? WHEEL_ZOOM_OUT : WHEEL_ZOOM_IN;
    viewport.zoom_at(factor, x, y, width, height);
}

// ---------------------------------------------------------------------------
// Touch
// ---------------------------------------------------------------------------
static double distance(Vec2 a, Vec2 b)
{
    return std::hypot(b.x - a.x, b.y - a.y);
}

void InputController::touch_start(int count, const Vec2* points)
{
    if (count == 1) {
        pointer_down(points[0].x, points[0].y);
    } else if (count >= 2) {
        pinch_start_dist = distance(points[0], points[1]);
        pinch_start_zoom = viewport.target().zoom;
        pointer_is_down  = false;
        is_dragging      = false;
    }
}

void InputController::touch_move(int count, const Vec2* points)
{
    if (count == 1) {
        pointer_move(points[0].x, points[0].y);
    } else if (count >= 2 && pinch_start_dist > 0.0) {
        const double current  = distance(points[0], points[1]);
        const double new_zoom = pinch_start_zoom * current / pinch_start_dist;
        const Vec2   mid      = lerp(points[0], points[1], 0.5);
        viewport.zoom_at(new_zoom / viewport.target().zoom, mid.x, mid.y, width, height);
    }
}

void InputController::touch_end()
{
    pointer_up();
    pinch_start_dist = 0.0;
}

// ---------------------------------------------------------------------------
// Keyboard
// ---------------------------------------------------------------------------
void InputController::key_down(Key key, bool ctrl, bool repeat)
{
    held.set(static_cast<size_t>(key));
    if (!ctrl || repeat) return;

    const ViewCamera& t = viewport.target();
    switch (key) {
        case Key::R:
            viewport.reset(reset_center);
            break;
        case Key::Equal:
        case Key::NumpadAdd:
            viewport.set_target(t.center, t.zoom * KEY_ZOOM_IN, t.rotation);
            break;
        case Key::Minus:
        case Key::NumpadSubtract:
            viewport.set_target(t.center, t.zoom * KEY_ZOOM_OUT, t.rotation);
            break;
        default:
            break;
    }
}

void InputController::key_up(Key key)
{
    held.reset(static_cast<size_t>(key));
}

bool InputController::poll()
{
    const double speed = KEY_PAN_SPEED / viewport.live().zoom;
    bool moved = false;

    auto shift = [&](double dre, double dim) {
        const ViewCamera& t = viewport.target();
        viewport.set_target({t.center.re + dre, t.center.im + dim}, t.zoom, t.rotation);
        moved = true;
    };

    if (is_held(Key::Left)  || is_held(Key::A)) shift(-speed, 0.0);
    if (is_held(Key::Right) || is_held(Key::D)) shift( speed, 0.0);
    if (is_held(Key::Up)    || is_held(Key::W)) shift(0.0,  speed);
    if (is_held(Key::Down)  || is_held(Key::S)) shift(0.0, -speed);

    if (is_held(Key::Q)) { viewport.rotate(-KEY_ROTATE_SPEED); moved = true; }
    if (is_held(Key::E)) { viewport.rotate( KEY_ROTATE_SPEED); moved = true; }

    return moved;
}
