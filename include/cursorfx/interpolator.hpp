#pragma once

#include <cursorfx/keyframe.hpp>
#include <cursorfx/timeline.hpp>
#include <optional>
#include <span>
#include <string>

namespace cursorfx
{

// Interpolated cursor state. Optional fields are absent when neither
// bracketing keyframe sets them; the caller falls back to CursorConfig.
struct CursorState
{
    double                     x = 0.0;
    double                     y = 0.0;
    std::optional<double>      size;
    std::optional<CursorShape> shape;
    std::optional<std::string> color;
};

bool operator==(const CursorState& a, const CursorState& b);

// Pure functions of (keyframes, time): identical inputs always give
// bit-identical results, whatever order they are called in. Keyframes must
// be sorted ascending (KeyframeTrack guarantees it).
//
// Times before the first keyframe clamp to it, times after the last clamp
// to the last. No extrapolation.

// Empty input yields nullopt.
std::optional<CursorState> interpolate_cursor(std::span<const CursorKeyframe> keyframes,
                                              TimeMs                          time,
                                              Easing fallback = DEFAULT_EASING);

std::optional<CursorState> interpolate_cursor(const CursorTimeline& timeline,
                                              TimeMs                time,
                                              Easing                fallback = DEFAULT_EASING);

// Empty input yields identity_zoom(video). Absent crop sizes resolve to
// video / level.
ZoomRegion interpolate_zoom(std::span<const ZoomKeyframe> keyframes,
                            TimeMs                        time,
                            const VideoSize&              video,
                            Easing                        fallback = DEFAULT_EASING);

ZoomRegion interpolate_zoom(const ZoomTimeline& timeline,
                            TimeMs              time,
                            const VideoSize&    video,
                            Easing              fallback = DEFAULT_EASING);

// Resolved crop of a single zoom keyframe.
double zoom_crop_width(const ZoomKeyframe& kf, const VideoSize& video);
double zoom_crop_height(const ZoomKeyframe& kf, const VideoSize& video);

}   // namespace cursorfx
