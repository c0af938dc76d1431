#include <algorithm>
#include <cursorfx/keyframe_generator.hpp>
#include <cursorfx/logger.hpp>
#include <cursorfx/timeline.hpp>
#include <cursorfx/zoom_path.hpp>

namespace cursorfx
{

namespace
{

// ─── Payload traits ─────────────────────────────────────────────────────────
//
// A Pose is the keyframe content without its timestamp. The synthesis loop
// only moves poses around in time; the traits say how to read one from a
// keyframe and how to stamp one back out.

struct CursorPayload
{
    using Keyframe = CursorKeyframe;
    using Pose     = Vec2;

    static Pose of(const CursorKeyframe& kf) { return {kf.x, kf.y}; }

    static CursorKeyframe at(TimeMs t, const Pose& p) { return CursorKeyframe(t, p.x, p.y); }
};

struct ZoomPayload
{
    using Keyframe = ZoomKeyframe;
    using Pose     = ZoomRegion;

    static Pose of(const ZoomKeyframe& kf)
    {
        Pose p;
        p.center_x    = kf.center_x;
        p.center_y    = kf.center_y;
        p.level       = kf.level;
        p.crop_width  = kf.crop_width.value_or(0.0);
        p.crop_height = kf.crop_height.value_or(0.0);
        return p;
    }

    static ZoomKeyframe at(TimeMs t, const Pose& p)
    {
        ZoomKeyframe kf(t, p.center_x, p.center_y, p.level);
        if (p.crop_width > 0.0 && p.crop_height > 0.0)
        {
            kf.crop_width  = p.crop_width;
            kf.crop_height = p.crop_height;
        }
        return kf;
    }
};

std::vector<ClickEvent> down_clicks(std::span<const ClickEvent> clicks)
{
    std::vector<ClickEvent> downs;
    for (const auto& c : clicks)
    {
        if (c.action == MouseAction::Down)
            downs.push_back(c);
    }
    std::stable_sort(downs.begin(),
                     downs.end(),
                     [](const ClickEvent& a, const ClickEvent& b)
                     { return a.timestamp < b.timestamp; });
    return downs;
}

// Synthesize-and-merge shared by both payloads. `initial` is the pose held
// before the first click; `pose_at_click` maps a click to its pose.
template <typename Payload, typename PoseAtClick>
std::vector<typename Payload::Keyframe> synthesize_and_merge(
    std::span<const typename Payload::Keyframe> existing,
    const std::vector<ClickEvent>&              downs,
    const typename Payload::Pose&               initial,
    PoseAtClick&&                               pose_at_click,
    TimeMs                                      video_duration,
    TimeMs                                      lead_ms,
    const EngineConfig&                         config)
{
    using Keyframe = typename Payload::Keyframe;

    std::vector<Keyframe> out(existing.begin(), existing.end());
    if (existing.empty())
        out.push_back(Payload::at(0.0, initial));

    auto previous = initial;
    for (const auto& click : downs)
    {
        const TimeMs before = std::max(0.0, click.timestamp - lead_ms);
        if (before < click.timestamp)
            out.push_back(Payload::at(before, previous));

        const auto pose = pose_at_click(click);
        out.push_back(Payload::at(click.timestamp, pose));
        previous = pose;
    }

    normalize_keyframes(out, config.min_keyframe_spacing_ms);

    if (video_duration > 0.0
        && (out.empty() || out.back().timestamp < video_duration - config.trailing_keyframe_gap_ms))
    {
        const auto last = out.empty() ? previous : Payload::of(out.back());
        out.push_back(Payload::at(video_duration, last));
    }
    return out;
}

double effective_frame_rate(double frame_rate, const EngineConfig& config)
{
    if (frame_rate > 0.0)
        return frame_rate;
    return config.default_frame_rate > 0.0 ? config.default_frame_rate : 30.0;
}

}   // anonymous namespace

TimeMs frames_to_ms(double frames, double frame_rate)
{
    if (frame_rate <= 0.0)
        return 0.0;
    return frames / frame_rate * 1000.0;
}

std::vector<CursorKeyframe> generate_cursor_keyframes(std::span<const CursorKeyframe> existing,
                                                      std::span<const ClickEvent>     clicks,
                                                      TimeMs                          video_duration,
                                                      double                          frame_rate,
                                                      const EngineConfig&             config)
{
    const auto downs = down_clicks(clicks);
    if (downs.empty() || static_cast<double>(existing.size()) >= downs.size() / 2.0)
        return std::vector<CursorKeyframe>(existing.begin(), existing.end());

    CURSORFX_LOG_INFO("generator",
                      "Auto-creating cursor keyframes from {} clicks (existing: {})",
                      downs.size(),
                      existing.size());

    const Vec2 initial = existing.empty() ? Vec2{downs.front().x, downs.front().y}
                                          : CursorPayload::of(existing.front());
    const TimeMs lead =
        frames_to_ms(config.lead_frames, effective_frame_rate(frame_rate, config));

    auto out = synthesize_and_merge<CursorPayload>(
        existing,
        downs,
        initial,
        [](const ClickEvent& c) { return Vec2{c.x, c.y}; },
        video_duration,
        lead,
        config);

    CURSORFX_LOG_INFO("generator", "Created {} cursor keyframes from clicks", out.size());
    return out;
}

std::vector<ZoomKeyframe> generate_zoom_keyframes(std::span<const ZoomKeyframe> existing,
                                                  std::span<const ClickEvent>   clicks,
                                                  const VideoSize&              video,
                                                  TimeMs                        video_duration,
                                                  double                        frame_rate,
                                                  const ZoomConfig&             zoom,
                                                  const EngineConfig&           config)
{
    const auto downs = down_clicks(clicks);
    const bool replace = config.zoom_generation == ZoomGenerationMode::Replace;
    if (downs.empty())
        return std::vector<ZoomKeyframe>(existing.begin(), existing.end());
    if (!replace && static_cast<double>(existing.size()) >= downs.size() / 2.0)
        return std::vector<ZoomKeyframe>(existing.begin(), existing.end());

    std::span<const ZoomKeyframe> kept = replace ? std::span<const ZoomKeyframe>{} : existing;

    CURSORFX_LOG_INFO("generator",
                      "Auto-creating zoom keyframes from {} clicks (kept: {})",
                      downs.size(),
                      kept.size());

    ZoomRegion initial = kept.empty() ? identity_zoom(video) : ZoomPayload::of(kept.front());
    // Identity crop is implied by level 1.
    if (kept.empty())
        initial.crop_width = initial.crop_height = 0.0;

    const TimeMs lead =
        frames_to_ms(config.lead_frames, effective_frame_rate(frame_rate, config));

    auto on_click = [&](const ClickEvent& c)
    {
        ZoomRegion r  = compute_zoom_region(c.x, c.y, video, zoom.level, c.timestamp);
        r.crop_width  = 0.0;
        r.crop_height = 0.0;
        return r;
    };

    return synthesize_and_merge<ZoomPayload>(
        kept, downs, initial, on_click, video_duration, lead, config);
}

}   // namespace cursorfx
