#pragma once

#include <cursorfx/keyframe.hpp>

namespace cursorfx
{

// Critically damped follower ("SmoothDamp") that lags a displayed position
// behind its target to produce a glide. Driven by wall-clock delta time,
// not video time.
//
// One instance per playback session. Call reset() after every
// non-sequential seek or content load, otherwise the position flies in
// from wherever it was left.
class MotionSmoother
{
   public:
    static constexpr double DEFAULT_SMOOTH_TIME = 0.2;   // seconds
    static constexpr double MAX_DELTA_SECONDS   = 0.1;   // frame hitch cap

    MotionSmoother() = default;
    MotionSmoother(double x,
                   double y,
                   double smooth_time       = DEFAULT_SMOOTH_TIME,
                   double max_delta_seconds = MAX_DELTA_SECONDS);

    // Move the target. Velocity is kept.
    void set_target(double x, double y);

    // Advance by dt seconds (clamped to [0, max_delta_seconds()]) and return
    // the new smoothed position.
    Vec2 update(double dt);

    // Snap position and target to (x, y) and zero the velocity.
    void reset(double x, double y);

    Vec2   position() const { return position_; }
    Vec2   target() const { return target_; }
    Vec2   velocity() const { return velocity_; }
    double smooth_time() const { return smooth_time_; }
    double max_delta_seconds() const { return max_dt_; }

   private:
    Vec2   position_;
    Vec2   target_;
    Vec2   velocity_;
    double smooth_time_ = DEFAULT_SMOOTH_TIME;
    double max_dt_      = MAX_DELTA_SECONDS;
};

}   // namespace cursorfx
