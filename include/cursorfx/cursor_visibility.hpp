#pragma once

#include <cursorfx/keyframe.hpp>
#include <optional>

namespace cursorfx
{

struct VisibilityConfig
{
    bool   hide_when_static    = false;
    double static_threshold_px = 2.0;      // movement below this is "static"
    TimeMs hide_after_ms       = 1000.0;
};

// Hides the cursor after it has stayed still for hide_after_ms.
// Always visible when hide_when_static is off. Reset on seek.
class CursorVisibilityTracker
{
   public:
    explicit CursorVisibilityTracker(VisibilityConfig config = {});

    bool update(double x, double y, TimeMs t);
    void reset();

    const VisibilityConfig& config() const { return config_; }

   private:
    VisibilityConfig    config_;
    std::optional<Vec2> last_;
    TimeMs              last_movement_ = 0.0;
};

}   // namespace cursorfx
