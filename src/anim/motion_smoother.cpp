#include <algorithm>
#include <cmath>
#include <cursorfx/motion_smoother.hpp>

namespace cursorfx
{

namespace
{

// Polynomial approximation of exp(-x) used by SmoothDamp.
constexpr double SMOOTHDAMP_C1 = 0.48;
constexpr double SMOOTHDAMP_C2 = 0.235;

// Below this distance and speed the follower snaps onto the target.
constexpr double CONVERGENCE_EPSILON = 0.0001;

void smooth_damp_axis(double& current, double& velocity, double target, double omega, double dt)
{
    const double x     = omega * dt;
    const double decay = 1.0 / (1.0 + x + SMOOTHDAMP_C1 * x * x + SMOOTHDAMP_C2 * x * x * x);

    const double change = current - target;
    const double temp   = (velocity + omega * change) * dt;

    velocity = (velocity - omega * temp) * decay;
    current  = target + (change + temp) * decay;
}

}   // anonymous namespace

MotionSmoother::MotionSmoother(double x, double y, double smooth_time, double max_delta_seconds)
    : position_{x, y},
      target_{x, y},
      smooth_time_(smooth_time > 0.0 ? smooth_time : DEFAULT_SMOOTH_TIME),
      max_dt_(max_delta_seconds > 0.0 ? max_delta_seconds : MAX_DELTA_SECONDS)
{
}

void MotionSmoother::set_target(double x, double y)
{
    target_ = {x, y};
}

Vec2 MotionSmoother::update(double dt)
{
    dt = std::clamp(dt, 0.0, max_dt_);
    if (dt <= 0.0)
        return position_;

    const bool settled = std::abs(position_.x - target_.x) < CONVERGENCE_EPSILON
                         && std::abs(position_.y - target_.y) < CONVERGENCE_EPSILON
                         && std::abs(velocity_.x) < CONVERGENCE_EPSILON
                         && std::abs(velocity_.y) < CONVERGENCE_EPSILON;
    if (settled)
    {
        position_ = target_;
        velocity_ = {};
        return position_;
    }

    const double omega = 2.0 / smooth_time_;
    smooth_damp_axis(position_.x, velocity_.x, target_.x, omega, dt);
    smooth_damp_axis(position_.y, velocity_.y, target_.y, omega, dt);
    return position_;
}

void MotionSmoother::reset(double x, double y)
{
    position_ = {x, y};
    target_   = {x, y};
    velocity_ = {};
}

}   // namespace cursorfx
