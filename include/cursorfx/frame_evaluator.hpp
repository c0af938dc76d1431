#pragma once

#include <cursorfx/config.hpp>
#include <cursorfx/cursor_visibility.hpp>
#include <cursorfx/metadata.hpp>
#include <cursorfx/motion_smoother.hpp>
#include <cursorfx/shape_stabilizer.hpp>
#include <cursorfx/timeline.hpp>
#include <cursorfx/zoom_path.hpp>
#include <optional>
#include <string>

namespace cursorfx
{

enum class EvaluationMode : uint8_t
{
    Preview,   // driven by the render loop, dt is wall-clock
    Export,    // driven by frame index, dt is one frame interval when smoothing
};

// Everything a compositor needs to draw the cursor for one frame.
struct CursorFrame
{
    double                     x          = 0.0;
    double                     y          = 0.0;
    double                     size       = 150.0;
    CursorShape                shape      = CursorShape::Arrow;
    std::optional<std::string> color;
    double                     scale      = 1.0;   // click pulse multiplier
    bool                       visible    = true;
    double                     velocity_x = 0.0;   // px/s, for motion blur
    double                     velocity_y = 0.0;
};

struct FrameParams
{
    TimeMs                     timestamp = 0.0;
    std::optional<CursorFrame> cursor;   // nullopt: no cursor keyframes, skip drawing
    ZoomRegion                 zoom;
    double                     zoom_velocity_x = 0.0;   // px/s of the zoom centre
    double                     zoom_velocity_y = 0.0;
};

// One playback or export session over a recording. Owns its own smoother,
// stabilizer, visibility tracker and zoom path cache, so a preview and an
// export of the same recording must use separate evaluators.
class FrameEvaluator
{
   public:
    explicit FrameEvaluator(EvaluationMode mode = EvaluationMode::Preview, EngineConfig config = {});

    // Takes a copy of the document, runs the click-driven generators when
    // enabled in the config, and resets all per-session state.
    void load(RecordingMetadata metadata);

    // Discontinuous jump: stateful filters restart at the next evaluation.
    void seek(TimeMs t);

    // Parameters at time t. dt_seconds is the time since the previous
    // evaluation (ignored in Export mode). A backwards step, or a forward
    // jump larger than max_delta_seconds (in Export mode, larger than one
    // frame interval if that is longer), is handled as a seek.
    //
    // Export mode keeps the cursor inside the video bounds. With smoothing
    // on, it also aims the smoother at the position smooth_time() ahead so
    // the cursor arrives on time.
    FrameParams evaluate(TimeMs t, double dt_seconds);

    // Parameters of frame `index`, sampled at index * 1000 / frame_rate.
    FrameParams evaluate_frame(size_t index);

    size_t frame_count() const;
    double frame_rate() const;

    // EngineConfig::smooth_preview or smooth_export, depending on mode.
    bool smoothing_enabled() const;

    // Smoother time constant in seconds: the document's animation style
    // preset when it names one, else EngineConfig::smooth_time.
    double smooth_time() const { return smoother_.smooth_time(); }

    EvaluationMode           mode() const { return mode_; }
    const EngineConfig&      config() const { return config_; }
    const RecordingMetadata& metadata() const { return metadata_; }
    const CursorTimeline&    cursor_timeline() const { return cursor_timeline_; }
    const ZoomTimeline&      zoom_timeline() const { return zoom_timeline_; }
    const ZoomPathGenerator& zoom_path() const { return zoom_path_; }

   private:
    ZoomRegion zoom_at(TimeMs t);
    Vec2       clamp_to_video(Vec2 p) const;

    EvaluationMode    mode_;
    EngineConfig      config_;
    RecordingMetadata metadata_;

    CursorTimeline          cursor_timeline_;
    ZoomTimeline            zoom_timeline_;
    MotionSmoother          smoother_;
    ShapeStabilizer         stabilizer_;
    CursorVisibilityTracker visibility_;
    ZoomPathGenerator       zoom_path_;

    bool   needs_reset_ = true;
    TimeMs last_time_   = 0.0;
    Vec2   prev_cursor_;
    Vec2   prev_zoom_;
};

}   // namespace cursorfx
