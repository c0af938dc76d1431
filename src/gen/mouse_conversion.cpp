#include <algorithm>
#include <cursorfx/keyframe_generator.hpp>
#include <cursorfx/logger.hpp>

namespace cursorfx
{

namespace
{

CursorShape shape_of(const MouseEvent& e)
{
    return e.cursor_type ? parse_cursor_shape(*e.cursor_type) : CursorShape::Arrow;
}

CursorKeyframe keyframe_at(TimeMs t, Vec2 pos, const MouseEvent& e, std::optional<Easing> easing)
{
    CursorKeyframe kf(t, pos.x, pos.y);
    kf.shape  = shape_of(e);
    kf.easing = easing;
    return kf;
}

}   // anonymous namespace

RecordedTrack convert_mouse_events_to_keyframes(std::span<const MouseEvent> events,
                                                TimeMs                      video_duration,
                                                const CoordinateMapper&     to_video)
{
    RecordedTrack out;
    if (events.empty())
        return out;

    auto map = [&](const MouseEvent& e) -> Vec2
    { return to_video ? to_video(e.x, e.y) : Vec2{e.x, e.y}; };

    for (const auto& e : events)
    {
        if (e.action == MouseAction::Move || !e.button)
            continue;
        const Vec2 pos = map(e);
        ClickEvent c;
        c.timestamp = e.timestamp;
        c.x         = pos.x;
        c.y         = pos.y;
        c.button    = *e.button;
        c.action    = e.action;
        out.clicks.push_back(c);
    }

    std::vector<const MouseEvent*> moves;
    for (const auto& e : events)
    {
        if (e.action == MouseAction::Move)
            moves.push_back(&e);
    }

    auto& kfs = out.cursor_keyframes;
    if (!moves.empty())
    {
        const MouseEvent& first     = *moves.front();
        const MouseEvent& last      = *moves.back();
        const Vec2        first_pos = map(first);
        const Vec2        last_pos  = map(last);

        kfs.push_back(keyframe_at(0.0, first_pos, first, Easing::EaseInOut));

        std::optional<std::string> current = first.cursor_type;
        for (const MouseEvent* e : moves)
        {
            if (!e->cursor_type || e->cursor_type == current)
                continue;
            kfs.push_back(keyframe_at(e->timestamp, map(*e), *e, Easing::EaseInOut));
            current = e->cursor_type;
        }

        const bool moved = first_pos.x != last_pos.x || first_pos.y != last_pos.y;
        if (video_duration > 0.0 && (moved || video_duration > first.timestamp))
            kfs.push_back(keyframe_at(video_duration, last_pos, last, std::nullopt));
    }
    else
    {
        const MouseEvent& first = events.front();
        kfs.push_back(keyframe_at(0.0, map(first), first, Easing::EaseInOut));
        if (video_duration > 0.0)
        {
            const MouseEvent& last = events.back();
            kfs.push_back(keyframe_at(video_duration, map(last), last, std::nullopt));
        }
    }

    std::stable_sort(kfs.begin(),
                     kfs.end(),
                     [](const CursorKeyframe& a, const CursorKeyframe& b)
                     { return a.timestamp < b.timestamp; });
    std::stable_sort(out.clicks.begin(),
                     out.clicks.end(),
                     [](const ClickEvent& a, const ClickEvent& b) { return a.timestamp < b.timestamp; });

    CURSORFX_LOG_INFO("generator",
                      "Converted {} mouse events to {} cursor keyframes and {} click events",
                      events.size(),
                      kfs.size(),
                      out.clicks.size());
    return out;
}

}   // namespace cursorfx
