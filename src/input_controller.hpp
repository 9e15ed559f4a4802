#pragma once

#include "view_state.hpp"
#include "viewport.hpp"

#include <bitset>

// Window-system independent key identifiers. The GUI maps its scancodes here.
enum class Key {
    Left, Right, Up, Down,
    A, D, W, S,
    Q, E, R,
    Equal, Minus, NumpadAdd, NumpadSubtract,
    Other,
};
constexpr int KEY_COUNT = static_cast<int>(Key::Other) + 1;

constexpr double DRAG_THRESHOLD_PX = 1.0;
constexpr double WHEEL_ZOOM_IN     = 1.25;
constexpr double WHEEL_ZOOM_OUT    = 0.8;
constexpr double KEY_PAN_SPEED     = 0.02;   // plane units at zoom 1, per tick
constexpr double KEY_ROTATE_SPEED  = 0.02;   // radians per tick
constexpr double KEY_ZOOM_IN       = 1.2;
constexpr double KEY_ZOOM_OUT      = 0.8;

struct PanMultipliers {
    double x = 1.0;
    double y = 1.0;
};

// Grab semantics for escape-time fractals, inverted for the geometric ones.
PanMultipliers pan_multipliers(FractalKind kind);

// ---------------------------------------------------------------------------
// Translates pointer, touch, wheel and key events into Viewport target
// updates. Held keys are polled once per frame through poll().
// ---------------------------------------------------------------------------
class InputController {
public:
    explicit InputController(Viewport& vp) : viewport(vp) {}

    // Pan direction and reset target follow the active fractal.
    void set_fractal(FractalKind kind);

    // Surface size in the same pixel units as event coordinates.
    void set_surface(double w, double h) { width = w; height = h; }

    void pointer_down(double x, double y);
    void pointer_move(double x, double y);
    void pointer_up();
    bool dragging() const { return is_dragging; }

    // wheel_dy > 0 zooms out, anything else zooms in.
    void wheel(double wheel_dy, double x, double y);

    // Touch points in surface pixels. One point pans, two points pinch.
    void touch_start(int count, const Vec2* points);
    void touch_move(int count, const Vec2* points);
    void touch_end();

    // `repeat` marks auto-repeated key-down events; one-shot shortcuts ignore them.
    void key_down(Key key, bool ctrl, bool repeat);
    void key_up(Key key);
    void release_all_keys() { held.reset(); }

    // Continuous pan/rotate for held keys. Returns true if the target moved.
    bool poll();

private:
    bool is_held(Key k) const { return held.test(static_cast<size_t>(k)); }

    Viewport&      viewport;
    PanMultipliers pan_mult;
    Complex        reset_center;
    double         width  = 1.0;
    double         height = 1.0;

    bool   pointer_is_down  = false;
    bool   is_dragging      = false;
    double last_x           = 0.0;
    double last_y           = 0.0;
    double pinch_start_dist = 0.0;
    double pinch_start_zoom = 1.0;

    std::bitset<KEY_COUNT> held;
};
