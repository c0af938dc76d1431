#pragma once

#include <cursorfx/keyframe.hpp>
#include <cursorfx/timeline.hpp>
#include <optional>
#include <span>
#include <vector>

namespace cursorfx
{

// Suppresses cursor-shape flicker: a new shape is committed only once it
// is known to persist for at least min_dwell_ms. Until then the previously
// committed shape is kept.
//
// With keyframes set, persistence is decided by look-ahead over the
// keyframe shape runs, so the result at a given time does not depend on
// how the caller got there (preview and export agree). Without keyframes,
// a raw shape must be observed continuously for min_dwell_ms of caller time.
//
// Stateful; reset() alongside the MotionSmoother on every seek.
class ShapeStabilizer
{
   public:
    static constexpr TimeMs DEFAULT_MIN_DWELL_MS = 100.0;

    explicit ShapeStabilizer(CursorShape initial   = CursorShape::Arrow,
                             TimeMs      min_dwell = DEFAULT_MIN_DWELL_MS);

    // Build the look-ahead table. Keyframes without a shape continue the
    // current run.
    void set_keyframes(std::span<const CursorKeyframe> keyframes);
    void set_keyframes(const CursorTimeline& timeline) { set_keyframes(timeline.view()); }

    // Feed the raw shape at time t; returns the committed shape.
    CursorShape update(CursorShape raw, TimeMs t);

    void reset(CursorShape shape);

    // Reset for a jump to time t. Commits the shape of the latest run at or
    // before t that lasts at least min_dwell_ms, so a seek never lands on a
    // transient shape. Without such a run the initial shape is committed.
    void reset_at(TimeMs t);

    CursorShape committed() const { return committed_; }
    TimeMs      min_dwell() const { return min_dwell_; }

    // A contiguous stretch of keyframes sharing one shape: [start, end).
    // end is the first keyframe with another shape, or +inf.
    struct ShapeRun
    {
        TimeMs      start;
        TimeMs      end;
        CursorShape shape;
    };

    const std::vector<ShapeRun>& runs() const { return runs_; }

   private:
    const ShapeRun* run_at(TimeMs t) const;

    CursorShape           initial_;
    CursorShape           committed_;
    TimeMs                min_dwell_;
    std::vector<ShapeRun> runs_;

    // Caller-time dwell tracking (no look-ahead available)
    std::optional<CursorShape> pending_;
    TimeMs                     pending_since_ = 0.0;
};

}   // namespace cursorfx
