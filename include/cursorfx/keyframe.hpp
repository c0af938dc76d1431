#pragma once

#include <cstdint>
#include <cursorfx/easing.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace cursorfx
{

// All timestamps are milliseconds relative to recording start.
using TimeMs = double;

// Keyframes closer than this are merged, keeping the later one.
inline constexpr TimeMs MIN_KEYFRAME_SPACING_MS = 10.0;

enum class CursorShape : uint8_t
{
    Arrow,
    Pointer,
    Hand,
    OpenHand,
    ClosedHand,
    Crosshair,
    IBeam,
    IBeamVertical,
    Move,
    ResizeLeft,
    ResizeRight,
    ResizeLeftRight,
    ResizeUp,
    ResizeDown,
    ResizeUpDown,
    Resize,
    Copy,
    DragCopy,
    DragLink,
    Help,
    NotAllowed,
    ContextMenu,
    Poof,
    Screenshot,
    ZoomIn,
    ZoomOut,
};

const char* cursor_shape_name(CursorShape shape);

// Unknown names fall back to Arrow.
CursorShape parse_cursor_shape(std::string_view name);

enum class MouseButton : uint8_t
{
    Left,
    Right,
    Middle,
};

enum class MouseAction : uint8_t
{
    Move,
    Down,
    Up,
};

const char*  mouse_button_name(MouseButton button);
MouseButton  parse_mouse_button(std::string_view name);
const char*  mouse_action_name(MouseAction action);
MouseAction  parse_mouse_action(std::string_view name);

struct Vec2
{
    double x = 0.0;
    double y = 0.0;
};

struct VideoSize
{
    double width  = 0.0;
    double height = 0.0;
};

// Explicit cursor state. Optional fields inherit from CursorConfig.
struct CursorKeyframe
{
    TimeMs                     timestamp = 0.0;
    double                     x         = 0.0;
    double                     y         = 0.0;
    std::optional<double>      size;
    std::optional<CursorShape> shape;
    std::optional<std::string> color;
    std::optional<Easing>      easing;

    CursorKeyframe() = default;
    CursorKeyframe(TimeMs t, double px, double py) : timestamp(t), x(px), y(py) {}
};

// Explicit zoom state. Crop defaults to video / level when absent.
struct ZoomKeyframe
{
    TimeMs                timestamp = 0.0;
    double                center_x  = 0.0;
    double                center_y  = 0.0;
    double                level     = 1.0;
    std::optional<double> crop_width;
    std::optional<double> crop_height;
    std::optional<Easing> easing;

    ZoomKeyframe() = default;
    ZoomKeyframe(TimeMs t, double cx, double cy, double lvl)
        : timestamp(t), center_x(cx), center_y(cy), level(lvl)
    {
    }
};

// Flat interval with one scale/center and no internal easing.
struct ZoomSection
{
    TimeMs start_time = 0.0;
    TimeMs end_time   = 0.0;
    double scale      = 1.0;
    double center_x   = 0.0;
    double center_y   = 0.0;
};

struct ClickEvent
{
    TimeMs      timestamp = 0.0;
    double      x         = 0.0;
    double      y         = 0.0;
    MouseButton button    = MouseButton::Left;
    MouseAction action    = MouseAction::Down;
};

// Raw pointer telemetry sample (moves and clicks).
struct MouseEvent
{
    TimeMs                     timestamp = 0.0;
    double                     x         = 0.0;
    double                     y         = 0.0;
    MouseAction                action    = MouseAction::Move;
    std::optional<MouseButton> button;        // set on down/up events
    std::optional<std::string> cursor_type;   // OS cursor name, see parse_cursor_shape
};

// Fully resolved zoom crop for one video frame.
struct ZoomRegion
{
    TimeMs timestamp   = 0.0;
    double center_x    = 0.0;
    double center_y    = 0.0;
    double level       = 1.0;
    double crop_width  = 0.0;
    double crop_height = 0.0;
};

bool operator==(const CursorKeyframe& a, const CursorKeyframe& b);
bool operator==(const ZoomKeyframe& a, const ZoomKeyframe& b);
bool operator==(const ZoomSection& a, const ZoomSection& b);
bool operator==(const ClickEvent& a, const ClickEvent& b);
bool operator==(const ZoomRegion& a, const ZoomRegion& b);

// Identity zoom for a video: level 1, full-frame crop, centred.
ZoomRegion identity_zoom(const VideoSize& video, TimeMs timestamp = 0.0);

}   // namespace cursorfx
