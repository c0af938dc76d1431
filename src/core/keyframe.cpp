#include <array>
#include <cursorfx/keyframe.hpp>
#include <utility>

namespace cursorfx
{

namespace
{

constexpr std::array<std::pair<CursorShape, const char*>, 26> SHAPE_NAMES = {{
    {CursorShape::Arrow, "arrow"},
    {CursorShape::Pointer, "pointer"},
    {CursorShape::Hand, "hand"},
    {CursorShape::OpenHand, "openhand"},
    {CursorShape::ClosedHand, "closedhand"},
    {CursorShape::Crosshair, "crosshair"},
    {CursorShape::IBeam, "ibeam"},
    {CursorShape::IBeamVertical, "ibeamvertical"},
    {CursorShape::Move, "move"},
    {CursorShape::ResizeLeft, "resizeleft"},
    {CursorShape::ResizeRight, "resizeright"},
    {CursorShape::ResizeLeftRight, "resizeleftright"},
    {CursorShape::ResizeUp, "resizeup"},
    {CursorShape::ResizeDown, "resizedown"},
    {CursorShape::ResizeUpDown, "resizeupdown"},
    {CursorShape::Resize, "resize"},
    {CursorShape::Copy, "copy"},
    {CursorShape::DragCopy, "dragcopy"},
    {CursorShape::DragLink, "draglink"},
    {CursorShape::Help, "help"},
    {CursorShape::NotAllowed, "notallowed"},
    {CursorShape::ContextMenu, "contextmenu"},
    {CursorShape::Poof, "poof"},
    {CursorShape::Screenshot, "screenshot"},
    {CursorShape::ZoomIn, "zoomin"},
    {CursorShape::ZoomOut, "zoomout"},
}};

}   // anonymous namespace

const char* cursor_shape_name(CursorShape shape)
{
    for (const auto& [s, name] : SHAPE_NAMES)
    {
        if (s == shape)
            return name;
    }
    return "arrow";
}

CursorShape parse_cursor_shape(std::string_view name)
{
    for (const auto& [s, n] : SHAPE_NAMES)
    {
        if (name == n)
            return s;
    }
    return CursorShape::Arrow;
}

const char* mouse_button_name(MouseButton button)
{
    switch (button)
    {
        case MouseButton::Left:
            return "left";
        case MouseButton::Right:
            return "right";
        case MouseButton::Middle:
            return "middle";
    }
    return "left";
}

MouseButton parse_mouse_button(std::string_view name)
{
    if (name == "right")
        return MouseButton::Right;
    if (name == "middle")
        return MouseButton::Middle;
    return MouseButton::Left;
}

const char* mouse_action_name(MouseAction action)
{
    switch (action)
    {
        case MouseAction::Move:
            return "move";
        case MouseAction::Down:
            return "down";
        case MouseAction::Up:
            return "up";
    }
    return "move";
}

MouseAction parse_mouse_action(std::string_view name)
{
    if (name == "down")
        return MouseAction::Down;
    if (name == "up")
        return MouseAction::Up;
    return MouseAction::Move;
}

bool operator==(const CursorKeyframe& a, const CursorKeyframe& b)
{
    return a.timestamp == b.timestamp && a.x == b.x && a.y == b.y && a.size == b.size
           && a.shape == b.shape && a.color == b.color && a.easing == b.easing;
}

bool operator==(const ZoomKeyframe& a, const ZoomKeyframe& b)
{
    return a.timestamp == b.timestamp && a.center_x == b.center_x && a.center_y == b.center_y
           && a.level == b.level && a.crop_width == b.crop_width
           && a.crop_height == b.crop_height && a.easing == b.easing;
}

bool operator==(const ZoomSection& a, const ZoomSection& b)
{
    return a.start_time == b.start_time && a.end_time == b.end_time && a.scale == b.scale
           && a.center_x == b.center_x && a.center_y == b.center_y;
}

bool operator==(const ClickEvent& a, const ClickEvent& b)
{
    return a.timestamp == b.timestamp && a.x == b.x && a.y == b.y && a.button == b.button
           && a.action == b.action;
}

bool operator==(const ZoomRegion& a, const ZoomRegion& b)
{
    return a.timestamp == b.timestamp && a.center_x == b.center_x && a.center_y == b.center_y
           && a.level == b.level && a.crop_width == b.crop_width
           && a.crop_height == b.crop_height;
}

ZoomRegion identity_zoom(const VideoSize& video, TimeMs timestamp)
{
    ZoomRegion r;
    r.timestamp   = timestamp;
    r.center_x    = video.width / 2.0;
    r.center_y    = video.height / 2.0;
    r.level       = 1.0;
    r.crop_width  = video.width;
    r.crop_height = video.height;
    return r;
}

}   // namespace cursorfx
