#pragma once

#include <cursorfx/config.hpp>
#include <cursorfx/keyframe.hpp>
#include <functional>
#include <span>
#include <vector>

namespace cursorfx
{

// Click-driven keyframe synthesis.
//
// For every `down` click (chronological) two keyframes are emitted: one
// lead_frames before the click at the previous click's location, and one at
// the click at its location. The result is merged with `existing`, sorted,
// deduplicated with the minimum spacing, and extended with a trailing
// keyframe at video_duration when the last one falls more than
// trailing_keyframe_gap_ms short of it.
//
// Generation only runs when existing.size() < clicks / 2; otherwise (and
// when there are no down clicks) `existing` is returned unchanged, so the
// output is a fixed point of a second run.
//
// frame_rate <= 0 falls back to config.default_frame_rate.

std::vector<CursorKeyframe> generate_cursor_keyframes(std::span<const CursorKeyframe> existing,
                                                      std::span<const ClickEvent>     clicks,
                                                      TimeMs                          video_duration,
                                                      double                          frame_rate,
                                                      const EngineConfig&             config = {});

// Zoom variant: zooms to zoom.level centred on each click (centre clamped so
// the crop stays in frame), starting from the identity zoom. In Merge mode
// existing zoom keyframes are kept like cursor keyframes; Replace mode
// rebuilds the timeline from clicks alone.
std::vector<ZoomKeyframe> generate_zoom_keyframes(std::span<const ZoomKeyframe> existing,
                                                  std::span<const ClickEvent>   clicks,
                                                  const VideoSize&              video,
                                                  TimeMs                        video_duration,
                                                  double                        frame_rate,
                                                  const ZoomConfig&             zoom,
                                                  const EngineConfig&           config = {});

// ─── Recorder telemetry ─────────────────────────────────────────────────────

struct RecordedTrack
{
    std::vector<CursorKeyframe> cursor_keyframes;
    std::vector<ClickEvent>     clicks;
};

// Maps screen coordinates to video coordinates.
using CoordinateMapper = std::function<Vec2(double x, double y)>;

// Turns raw pointer telemetry into the document's cursor track:
//  - every down/up event that carries a button becomes a ClickEvent;
//  - the first move gives an EaseInOut keyframe at t=0;
//  - each change of cursor_type along the moves gives an EaseInOut keyframe;
//  - the last move gives an end keyframe at video_duration (no easing) when
//    video_duration > 0 and the pointer moved or the video outlasts the
//    first move.
// With no moves at all, the first event gives the t=0 keyframe and the last
// event the end keyframe. Shapes go through parse_cursor_shape, so absent or
// unknown cursor types become Arrow. Both outputs are sorted by timestamp.
RecordedTrack convert_mouse_events_to_keyframes(std::span<const MouseEvent> events,
                                                TimeMs                      video_duration,
                                                const CoordinateMapper&     to_video = {});

// Lead time in ms for `frames` frames at frame_rate.
TimeMs frames_to_ms(double frames, double frame_rate);

}   // namespace cursorfx
