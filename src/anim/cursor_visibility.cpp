#include <cmath>
#include <cursorfx/cursor_visibility.hpp>

namespace cursorfx
{

CursorVisibilityTracker::CursorVisibilityTracker(VisibilityConfig config) : config_(config) {}

bool CursorVisibilityTracker::update(double x, double y, TimeMs t)
{
    if (!last_)
    {
        // First sample after a reset counts as movement.
        last_          = Vec2{x, y};
        last_movement_ = t;
    }
    else
    {
        const double moved = std::hypot(x - last_->x, y - last_->y);
        if (moved > config_.static_threshold_px)
            last_movement_ = t;
        last_ = Vec2{x, y};
    }

    if (!config_.hide_when_static)
        return true;
    return (t - last_movement_) < config_.hide_after_ms;
}

void CursorVisibilityTracker::reset()
{
    last_.reset();
    last_movement_ = 0.0;
}

}   // namespace cursorfx
