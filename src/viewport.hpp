#pragma once

#include "complex_math.hpp"

constexpr double MIN_ZOOM        = 1e-4;
constexpr double ANIMATION_SPEED = 0.15;           // fraction of remaining distance per tick
// Absolute snap distance. A field also snaps once a step no longer changes it.
// Settle time grows with the log of the zoom jump: 1 -> 1e15 takes about 220
// reference ticks.
constexpr double SETTLE_EPSILON  = 1e-8;
constexpr double REFERENCE_TICK  = 1.0 / 60.0;     // seconds

// Render-time bundle derived from the live camera.
struct ShaderParams {
    Complex center;
    double  zoom     = 1.0;
    double  rotation = 0.0;
    double  aspect   = 1.0;
    double  range    = 4.0;
};

// Damping weight for a frame of length dt. Exactly ANIMATION_SPEED for one
// reference tick; dt <= 0 is treated as one reference tick.
double damping_alpha(double dt);

// One animation step: every field moves `alpha` of the way toward its target
// and snaps once it is within SETTLE_EPSILON.
ViewCamera step_camera(const ViewCamera& live, const ViewCamera& target, double alpha);

bool cameras_equal(const ViewCamera& a, const ViewCamera& b);

// ---------------------------------------------------------------------------
// Animated camera. External code only writes the target; the live camera is
// written by update()/advance() alone.
// ---------------------------------------------------------------------------
class Viewport {
public:
    Viewport() = default;
    explicit Viewport(const ViewCamera& initial) : live_cam(initial), target_cam(initial) {}

    // Zoom is clamped to MIN_ZOOM. Non-finite input is ignored.
    void set_target(Complex center, double zoom, double rotation);

    // Returns true while still animating.
    bool update() { return advance(REFERENCE_TICK); }
    bool advance(double dt);

    bool settled() const { return cameras_equal(live_cam, target_cam); }

    // Screen-space drag delta in pixels. Positive dx moves the center left.
    void pan(double dx, double dy, double w, double h);

    // Keeps the plane point under (sx, sy) fixed while zooming by `factor`.
    void zoom_at(double factor, double sx, double sy, double w, double h);

    void rotate(double delta) { set_target(target_cam.center, target_cam.zoom, target_cam.rotation + delta); }

    void reset(Complex center = {}) { set_target(center, 1.0, 0.0); }

    // Live and target both jump to `cam` (session restore).
    void jump_to(const ViewCamera& cam);

    ShaderParams shader_params(double w, double h) const;

    const ViewCamera& live()   const { return live_cam; }
    const ViewCamera& target() const { return target_cam; }

private:
    ViewCamera live_cam;
    ViewCamera target_cam;
};
