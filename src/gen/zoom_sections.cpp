#include <algorithm>
#include <cmath>
#include <cursorfx/logger.hpp>
#include <cursorfx/timeline.hpp>
#include <cursorfx/zoom_path.hpp>
#include <limits>

namespace cursorfx
{

namespace
{

ZoomKeyframe make_keyframe(TimeMs t, double cx, double cy, double level)
{
    ZoomKeyframe kf(t, cx, cy, level);
    kf.easing = Easing::EaseInOut;
    return kf;
}

ZoomKeyframe identity_keyframe(TimeMs t, const VideoSize& video)
{
    return make_keyframe(t, video.width * 0.5, video.height * 0.5, 1.0);
}

double distance(double x1, double y1, double x2, double y2)
{
    return std::hypot(x2 - x1, y2 - y1);
}

}   // anonymous namespace

// ─── Section compiler ───────────────────────────────────────────────────────

std::vector<ZoomKeyframe> sections_to_keyframes(std::span<const ZoomSection> sections,
                                                const VideoSize&             video,
                                                TimeMs                       transition_ms)
{
    std::vector<ZoomSection> sorted;
    sorted.reserve(sections.size());
    for (const auto& s : sections)
    {
        if (s.end_time > s.start_time && s.scale > 0.0 && std::isfinite(s.start_time)
            && std::isfinite(s.end_time))
            sorted.push_back(s);
    }
    std::stable_sort(sorted.begin(),
                     sorted.end(),
                     [](const ZoomSection& a, const ZoomSection& b)
                     { return a.start_time < b.start_time; });

    // Clip overlaps so each section ends where the next begins.
    for (size_t i = 0; i + 1 < sorted.size(); ++i)
        sorted[i].end_time = std::min(sorted[i].end_time, sorted[i + 1].start_time);
    std::erase_if(sorted, [](const ZoomSection& s) { return s.end_time <= s.start_time; });

    const TimeMs transition = std::max(0.0, transition_ms);

    std::vector<ZoomKeyframe> keyframes;
    for (size_t i = 0; i < sorted.size(); ++i)
    {
        const auto&  s    = sorted[i];
        const TimeMs ramp = std::min(transition, (s.end_time - s.start_time) * 0.5);

        // Hold the preceding state until the section begins.
        if (keyframes.empty())
        {
            if (s.start_time > 0.0)
                keyframes.push_back(identity_keyframe(0.0, video));
            keyframes.push_back(identity_keyframe(s.start_time, video));
        }
        else if (keyframes.back().timestamp < s.start_time)
        {
            ZoomKeyframe hold = keyframes.back();
            hold.timestamp    = s.start_time;
            keyframes.push_back(hold);
        }

        keyframes.push_back(make_keyframe(s.start_time + ramp, s.center_x, s.center_y, s.scale));
        keyframes.push_back(make_keyframe(s.end_time, s.center_x, s.center_y, s.scale));

        // Zoom back out unless the next section starts within the transition.
        const TimeMs gap = (i + 1 < sorted.size()) ? sorted[i + 1].start_time - s.end_time
                                                   : std::numeric_limits<TimeMs>::infinity();
        if (gap >= transition)
            keyframes.push_back(identity_keyframe(s.end_time + transition, video));
    }

    normalize_keyframes(keyframes, MIN_KEYFRAME_SPACING_MS);
    return keyframes;
}

// ─── Section detection ──────────────────────────────────────────────────────

std::vector<ZoomSection> detect_zoom_sections(std::span<const MouseEvent> events,
                                              const VideoSize&            video,
                                              const ZoomConfig&           zoom,
                                              const EngineConfig&         engine)
{
    std::vector<ZoomSection> sections;
    if (events.empty())
        return sections;

    const double dead_zone  = zoom.dead_zone > 0.0 ? zoom.dead_zone : 15.0;
    const TimeMs min_static = engine.min_static_duration_ms;
    const size_t lookahead  = std::max<size_t>(engine.section_lookahead, 1);

    auto make_section = [&](TimeMs start, TimeMs end, bool is_static, double cx, double cy)
    {
        ZoomSection s;
        s.start_time = start;
        s.end_time   = end;
        s.scale      = is_static ? zoom.level : 1.0;
        s.center_x   = is_static ? cx : video.width * 0.5;
        s.center_y   = is_static ? cy : video.height * 0.5;
        return s;
    };

    bool   in_static     = true;
    TimeMs section_start = events[0].timestamp;
    double anchor_x      = events[0].x;
    double anchor_y      = events[0].y;
    TimeMs last_time     = events[0].timestamp;

    for (size_t i = 1; i < events.size(); ++i)
    {
        const auto& ev = events[i];
        last_time      = ev.timestamp;

        if (in_static)
        {
            if (distance(anchor_x, anchor_y, ev.x, ev.y) > dead_zone)
            {
                sections.push_back(
                    make_section(section_start, ev.timestamp, true, anchor_x, anchor_y));
                in_static     = false;
                section_start = ev.timestamp;
            }
            continue;
        }

        // Moving: settle once the pointer stays inside the dead zone for
        // min_static within the look-ahead window.
        bool   settles = true;
        TimeMs held    = 0.0;
        const size_t scan_end = std::min(events.size(), i + lookahead);
        for (size_t j = i + 1; j < scan_end; ++j)
        {
            const auto& next = events[j];
            if (distance(ev.x, ev.y, next.x, next.y) > dead_zone)
            {
                settles = false;
                break;
            }
            held = next.timestamp - ev.timestamp;
            if (held >= min_static)
                break;
        }

        if (settles && held >= min_static)
        {
            sections.push_back(make_section(section_start, ev.timestamp, false, 0.0, 0.0));
            in_static     = true;
            section_start = ev.timestamp;
            anchor_x      = ev.x;
            anchor_y      = ev.y;
        }
    }

    sections.push_back(make_section(section_start, last_time, in_static, anchor_x, anchor_y));

    CURSORFX_LOG_DEBUG("zoom",
                       "Detected {} zoom sections from {} pointer events",
                       sections.size(),
                       events.size());
    return sections;
}

}   // namespace cursorfx
