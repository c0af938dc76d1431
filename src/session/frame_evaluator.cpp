#include <algorithm>
#include <cmath>
#include <cursorfx/click_pulse.hpp>
#include <cursorfx/frame_evaluator.hpp>
#include <cursorfx/interpolator.hpp>
#include <cursorfx/keyframe_generator.hpp>
#include <cursorfx/logger.hpp>

namespace cursorfx
{

FrameEvaluator::FrameEvaluator(EvaluationMode mode, EngineConfig config)
    : mode_(mode),
      config_(std::move(config)),
      smoother_(0.0, 0.0, config_.smooth_time, config_.max_delta_seconds),
      stabilizer_(CursorShape::Arrow, config_.shape_min_dwell_ms),
      visibility_(config_.visibility)
{
}

void FrameEvaluator::load(RecordingMetadata metadata)
{
    metadata_ = std::move(metadata);

    const double fr    = frame_rate();
    const auto   video = metadata_.video.size();

    if (config_.auto_generate_cursor)
    {
        metadata_.cursor.keyframes = generate_cursor_keyframes(metadata_.cursor.keyframes,
                                                               metadata_.clicks,
                                                               metadata_.video.duration,
                                                               fr,
                                                               config_);
    }
    if (config_.auto_generate_zoom)
    {
        metadata_.zoom.keyframes = generate_zoom_keyframes(metadata_.zoom.keyframes,
                                                           metadata_.clicks,
                                                           video,
                                                           metadata_.video.duration,
                                                           fr,
                                                           metadata_.zoom.config,
                                                           config_);
    }

    cursor_timeline_ = CursorTimeline(metadata_.cursor.keyframes, config_.min_keyframe_spacing_ms);
    zoom_timeline_   = ZoomTimeline(metadata_.zoom.keyframes, config_.min_keyframe_spacing_ms);

    stabilizer_ = ShapeStabilizer(metadata_.cursor.config.shape, config_.shape_min_dwell_ms);
    stabilizer_.set_keyframes(cursor_timeline_);

    const auto&  style       = metadata_.cursor.config.animation_style;
    const double smooth_time = style ? animation_style_preset(*style).smooth_time : config_.smooth_time;
    double       max_dt      = config_.max_delta_seconds;
    // Export steps by whole frames, so the hitch cap must admit one.
    if (mode_ == EvaluationMode::Export)
        max_dt = std::max(max_dt, 1.0 / fr);
    smoother_ = MotionSmoother(0.0, 0.0, smooth_time, max_dt);

    VisibilityConfig vis = config_.visibility;
    vis.hide_when_static = vis.hide_when_static || metadata_.cursor.config.hide_when_static;
    visibility_          = CursorVisibilityTracker(vis);

    zoom_path_.invalidate();
    needs_reset_ = true;

    CURSORFX_LOG_INFO("session",
                      "Loaded recording: {} cursor keyframes, {} zoom keyframes, {} sections, {} frames",
                      cursor_timeline_.size(),
                      zoom_timeline_.size(),
                      metadata_.zoom.sections.size(),
                      frame_count());
}

void FrameEvaluator::seek(TimeMs t)
{
    CURSORFX_LOG_DEBUG("session", "Seek to {}ms", t);
    needs_reset_ = true;
    last_time_   = t;
}

double FrameEvaluator::frame_rate() const
{
    if (metadata_.video.frame_rate > 0.0)
        return metadata_.video.frame_rate;
    return config_.default_frame_rate;
}

size_t FrameEvaluator::frame_count() const
{
    return frame_count_for(metadata_.video.duration, frame_rate());
}

ZoomRegion FrameEvaluator::zoom_at(TimeMs t)
{
    const auto  video = metadata_.video.size();
    const auto& zoom  = metadata_.zoom;

    if (!zoom.config.enabled)
        return identity_zoom(video, t);

    if (!zoom.sections.empty())
    {
        const auto& regions = zoom_path_.generate(zoom.sections,
                                                  video,
                                                  zoom.config,
                                                  frame_rate(),
                                                  metadata_.video.duration);
        if (auto r = zoom_region_at(regions, t, frame_rate()))
            return *r;
        return identity_zoom(video, t);
    }

    return interpolate_zoom(zoom_timeline_, t, video);
}

Vec2 FrameEvaluator::clamp_to_video(Vec2 p) const
{
    const auto video = metadata_.video.size();
    if (video.width > 0.0)
        p.x = std::clamp(p.x, 0.0, video.width);
    if (video.height > 0.0)
        p.y = std::clamp(p.y, 0.0, video.height);
    return p;
}

FrameParams FrameEvaluator::evaluate(TimeMs t, double dt_seconds)
{
    const bool   export_mode = mode_ == EvaluationMode::Export;
    const double dt          = export_mode ? 1.0 / frame_rate() : dt_seconds;

    // Sequential playback advances by at most max_step; anything else is a seek.
    TimeMs max_step = config_.max_delta_seconds * 1000.0;
    if (export_mode)
        max_step = std::max(max_step, 1000.0 / frame_rate());
    if (!needs_reset_ && (t < last_time_ || t - last_time_ > max_step + 1e-6))
        needs_reset_ = true;
    last_time_ = t;

    const bool reset = needs_reset_;
    needs_reset_     = false;

    FrameParams out;
    out.timestamp = t;
    out.zoom      = zoom_at(t);

    const Vec2 zoom_center{out.zoom.center_x, out.zoom.center_y};
    if (!reset && dt > 0.0)
    {
        out.zoom_velocity_x = (zoom_center.x - prev_zoom_.x) / dt;
        out.zoom_velocity_y = (zoom_center.y - prev_zoom_.y) / dt;
    }
    prev_zoom_ = zoom_center;

    auto state = interpolate_cursor(cursor_timeline_, t, config_.cursor_default_easing);
    if (!state)
        return out;

    const auto&       cfg = metadata_.cursor.config;
    const CursorShape raw = state->shape.value_or(cfg.shape);

    Vec2 target{state->x, state->y};
    if (export_mode && smoothing_enabled())
    {
        TimeMs ahead = t + smoother_.smooth_time() * 1000.0;
        if (metadata_.video.duration > 0.0)
            ahead = std::min(ahead, metadata_.video.duration);
        if (auto s = interpolate_cursor(cursor_timeline_, ahead, config_.cursor_default_easing))
            target = {s->x, s->y};
    }
    if (export_mode)
        target = clamp_to_video(target);

    if (reset)
    {
        smoother_.reset(target.x, target.y);
        stabilizer_.reset_at(t);
        visibility_.reset();
        prev_cursor_ = target;
    }

    Vec2 pos = target;
    if (smoothing_enabled())
    {
        smoother_.set_target(target.x, target.y);
        pos = smoother_.update(dt);
        if (export_mode)
            pos = clamp_to_video(pos);
    }

    CursorFrame frame;
    frame.x       = pos.x;
    frame.y       = pos.y;
    frame.size    = state->size.value_or(cfg.size);
    frame.shape   = stabilizer_.update(raw, t);
    frame.color   = state->color ? state->color : cfg.color;
    frame.scale   = click_pulse_scale(t, metadata_.clicks, config_.click_pulse);
    frame.visible = visibility_.update(pos.x, pos.y, t);
    if (dt > 0.0)
    {
        frame.velocity_x = (pos.x - prev_cursor_.x) / dt;
        frame.velocity_y = (pos.y - prev_cursor_.y) / dt;
    }
    prev_cursor_ = pos;
    out.cursor   = std::move(frame);
    return out;
}

bool FrameEvaluator::smoothing_enabled() const
{
    return mode_ == EvaluationMode::Export ? config_.smooth_export : config_.smooth_preview;
}

FrameParams FrameEvaluator::evaluate_frame(size_t index)
{
    const double fr = frame_rate();
    return evaluate(frame_time(index, fr), 1.0 / fr);
}

}   // namespace cursorfx
