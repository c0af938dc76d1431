#pragma once

#include <cursorfx/click_pulse.hpp>
#include <cursorfx/cursor_visibility.hpp>
#include <cursorfx/easing.hpp>
#include <cursorfx/keyframe.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace cursorfx
{

// Cursor follow presets. Each maps to a MotionSmoother time constant.
enum class AnimationStyle : uint8_t
{
    Slow,
    Mellow,
    Quick,
    Rapid,
};

struct AnimationStylePreset
{
    double smooth_time;       // seconds
    double min_smooth_time;   // floor for velocity-adaptive smoothing
};

AnimationStylePreset animation_style_preset(AnimationStyle style);
const char*          animation_style_name(AnimationStyle style);
AnimationStyle       parse_animation_style(std::string_view name);   // unknown -> Mellow

// Global cursor appearance stored in the recording document. Keyframe
// fields override these when present.
struct CursorConfig
{
    double                     size             = 150.0;
    CursorShape                shape            = CursorShape::Arrow;
    double                     smoothing        = 0.0;   // 0-1
    std::optional<std::string> color;
    bool                       hide_when_static = false;
    // Absent: the evaluator uses EngineConfig::smooth_time.
    std::optional<AnimationStyle> animation_style;
};

// Global zoom settings stored in the recording document.
struct ZoomConfig
{
    bool                       enabled          = true;
    double                     level            = 2.0;     // zoom multiplier applied on focus
    TimeMs                     transition_speed = 300.0;   // eased transition into/out of a section
    double                     padding          = 0.0;
    double                     follow_speed     = 1.0;
    double                     dead_zone        = 15.0;    // px of wobble ignored by section detection
    std::optional<std::string> smoothness;                 // renderer preset name, e.g. "cinematic"
};

// Overlay effects drawn by the compositor. Carried through the document
// untouched by the evaluator.
struct ClickCirclesConfig
{
    bool        enabled  = false;
    double      size     = 40.0;
    std::string color    = "#ffffff";
    TimeMs      duration = 400.0;
};

struct TrailConfig
{
    bool        enabled    = false;
    int         length     = 5;
    double      fade_speed = 0.5;
    std::string color      = "#ffffff";
};

struct HighlightRingConfig
{
    bool        enabled     = false;
    double      size        = 30.0;
    std::string color       = "#ffffff";
    double      pulse_speed = 0.5;
};

struct MouseEffectsConfig
{
    ClickCirclesConfig  click_circles;
    TrailConfig         trail;
    HighlightRingConfig highlight_ring;
};

bool operator==(const CursorConfig& a, const CursorConfig& b);
bool operator==(const ZoomConfig& a, const ZoomConfig& b);
bool operator==(const ClickCirclesConfig& a, const ClickCirclesConfig& b);
bool operator==(const TrailConfig& a, const TrailConfig& b);
bool operator==(const HighlightRingConfig& a, const HighlightRingConfig& b);
bool operator==(const MouseEffectsConfig& a, const MouseEffectsConfig& b);

// What the click-driven zoom generator does with existing zoom keyframes.
enum class ZoomGenerationMode : uint8_t
{
    Merge,     // fill gaps, keep user keyframes that are far enough away
    Replace,   // rebuild the zoom timeline from clicks alone
};

// Engine tunables. Defaults reproduce the recorder's behaviour.
struct EngineConfig
{
    static constexpr int MAX_LEAD_FRAMES = 1000;

    // Keyframe generation
    TimeMs             min_keyframe_spacing_ms  = MIN_KEYFRAME_SPACING_MS;
    TimeMs             trailing_keyframe_gap_ms = 100.0;
    int                lead_frames              = 7;   // clamped to [0, MAX_LEAD_FRAMES] on load
    double             default_frame_rate       = 30.0;
    bool               auto_generate_cursor     = true;
    bool               auto_generate_zoom       = false;
    ZoomGenerationMode zoom_generation          = ZoomGenerationMode::Merge;

    // Per-frame evaluation
    Easing           cursor_default_easing = Easing::Linear;
    ClickPulseConfig click_pulse;
    bool             smooth_preview     = true;
    bool             smooth_export      = false;   // export samples the raw timeline
    double           smooth_time        = 0.2;     // seconds
    double           max_delta_seconds  = 0.1;
    TimeMs           shape_min_dwell_ms = 100.0;
    VisibilityConfig visibility;

    // Section detection
    TimeMs min_static_duration_ms = 300.0;
    size_t section_lookahead      = 50;

    // Serialize to a flat JSON object.
    std::string serialize() const;

    // Missing keys keep their current value. Returns false if the text is
    // not a JSON object.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // $HOME/.config/cursorfx/engine.json
    static std::string default_path();
};

}   // namespace cursorfx
