#include <algorithm>
#include <cmath>
#include <cursorfx/interpolator.hpp>
#include <utility>

namespace cursorfx
{

namespace
{

// Indices (prev, next) of the keyframes bracketing time. prev is the last
// keyframe with timestamp <= time, next the first with timestamp > time.
// Clamped to the first/last keyframe outside the covered range.
template <typename K>
std::pair<size_t, size_t> find_bracket(std::span<const K> keyframes, TimeMs time)
{
    auto upper = std::upper_bound(keyframes.begin(),
                                  keyframes.end(),
                                  time,
                                  [](TimeMs t, const K& k) { return t < k.timestamp; });

    if (upper == keyframes.begin())
        return {0, 0};
    if (upper == keyframes.end())
        return {keyframes.size() - 1, keyframes.size() - 1};

    auto next = static_cast<size_t>(std::distance(keyframes.begin(), upper));
    return {next - 1, next};
}

template <typename K>
double segment_progress(const K& prev, const K& next, TimeMs time, Easing fallback)
{
    double progress = (time - prev.timestamp) / (next.timestamp - prev.timestamp);
    progress        = std::clamp(progress, 0.0, 1.0);
    return apply_easing(prev.easing.value_or(fallback), progress);
}

// std::lerp is exact at both endpoints.
double blend(double a, double b, double e)
{
    return std::lerp(a, b, e);
}

CursorState cursor_state_of(const CursorKeyframe& kf)
{
    return CursorState{kf.x, kf.y, kf.size, kf.shape, kf.color};
}

double safe_level(double level)
{
    return level > 0.0 ? level : 1.0;
}

ZoomRegion zoom_region_of(const ZoomKeyframe& kf, const VideoSize& video, TimeMs time)
{
    ZoomRegion r;
    r.timestamp   = time;
    r.center_x    = kf.center_x;
    r.center_y    = kf.center_y;
    r.level       = kf.level;
    r.crop_width  = zoom_crop_width(kf, video);
    r.crop_height = zoom_crop_height(kf, video);
    return r;
}

}   // anonymous namespace

bool operator==(const CursorState& a, const CursorState& b)
{
    return a.x == b.x && a.y == b.y && a.size == b.size && a.shape == b.shape
           && a.color == b.color;
}

double zoom_crop_width(const ZoomKeyframe& kf, const VideoSize& video)
{
    return kf.crop_width.value_or(video.width / safe_level(kf.level));
}

double zoom_crop_height(const ZoomKeyframe& kf, const VideoSize& video)
{
    return kf.crop_height.value_or(video.height / safe_level(kf.level));
}

// ─── Cursor ─────────────────────────────────────────────────────────────────

std::optional<CursorState> interpolate_cursor(std::span<const CursorKeyframe> keyframes,
                                              TimeMs                          time,
                                              Easing                          fallback)
{
    if (keyframes.empty())
        return std::nullopt;
    if (keyframes.size() == 1)
        return cursor_state_of(keyframes.front());

    auto [pi, ni]    = find_bracket(keyframes, time);
    const auto& prev = keyframes[pi];
    const auto& next = keyframes[ni];

    if (prev.timestamp == next.timestamp)
        return cursor_state_of(prev);

    const double e = segment_progress(prev, next, time, fallback);

    CursorState s;
    s.x = blend(prev.x, next.x, e);
    s.y = blend(prev.y, next.y, e);
    if (prev.size && next.size)
        s.size = blend(*prev.size, *next.size, e);
    else
        s.size = prev.size ? prev.size : next.size;
    s.shape = prev.shape ? prev.shape : next.shape;
    s.color = prev.color ? prev.color : next.color;
    return s;
}

std::optional<CursorState> interpolate_cursor(const CursorTimeline& timeline,
                                              TimeMs                time,
                                              Easing                fallback)
{
    return interpolate_cursor(timeline.view(), time, fallback);
}

// ─── Zoom ───────────────────────────────────────────────────────────────────

ZoomRegion interpolate_zoom(std::span<const ZoomKeyframe> keyframes,
                            TimeMs                        time,
                            const VideoSize&              video,
                            Easing                        fallback)
{
    if (keyframes.empty())
        return identity_zoom(video, time);
    if (keyframes.size() == 1)
        return zoom_region_of(keyframes.front(), video, time);

    auto [pi, ni]    = find_bracket(keyframes, time);
    const auto& prev = keyframes[pi];
    const auto& next = keyframes[ni];

    if (prev.timestamp == next.timestamp)
        return zoom_region_of(prev, video, time);

    const double e = segment_progress(prev, next, time, fallback);

    ZoomRegion r;
    r.timestamp   = time;
    r.center_x    = blend(prev.center_x, next.center_x, e);
    r.center_y    = blend(prev.center_y, next.center_y, e);
    r.level       = blend(prev.level, next.level, e);
    r.crop_width  = blend(zoom_crop_width(prev, video), zoom_crop_width(next, video), e);
    r.crop_height = blend(zoom_crop_height(prev, video), zoom_crop_height(next, video), e);
    return r;
}

ZoomRegion interpolate_zoom(const ZoomTimeline& timeline,
                            TimeMs              time,
                            const VideoSize&    video,
                            Easing              fallback)
{
    return interpolate_zoom(timeline.view(), time, video, fallback);
}

}   // namespace cursorfx
