#include <cstdlib>
#include <cursorfx/config.hpp>
#include <cursorfx/logger.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include "io/json.hpp"

namespace cursorfx
{

bool operator==(const CursorConfig& a, const CursorConfig& b)
{
    return a.size == b.size && a.shape == b.shape && a.smoothing == b.smoothing
           && a.color == b.color && a.hide_when_static == b.hide_when_static
           && a.animation_style == b.animation_style;
}

bool operator==(const ZoomConfig& a, const ZoomConfig& b)
{
    return a.enabled == b.enabled && a.level == b.level
           && a.transition_speed == b.transition_speed && a.padding == b.padding
           && a.follow_speed == b.follow_speed && a.dead_zone == b.dead_zone
           && a.smoothness == b.smoothness;
}

bool operator==(const ClickCirclesConfig& a, const ClickCirclesConfig& b)
{
    return a.enabled == b.enabled && a.size == b.size && a.color == b.color
           && a.duration == b.duration;
}

bool operator==(const TrailConfig& a, const TrailConfig& b)
{
    return a.enabled == b.enabled && a.length == b.length && a.fade_speed == b.fade_speed
           && a.color == b.color;
}

bool operator==(const HighlightRingConfig& a, const HighlightRingConfig& b)
{
    return a.enabled == b.enabled && a.size == b.size && a.color == b.color
           && a.pulse_speed == b.pulse_speed;
}

bool operator==(const MouseEffectsConfig& a, const MouseEffectsConfig& b)
{
    return a.click_circles == b.click_circles && a.trail == b.trail
           && a.highlight_ring == b.highlight_ring;
}

// ─── Animation styles ───────────────────────────────────────────────────────

AnimationStylePreset animation_style_preset(AnimationStyle style)
{
    switch (style)
    {
        case AnimationStyle::Slow:
            return {0.45, 0.15};
        case AnimationStyle::Mellow:
            return {0.25, 0.08};
        case AnimationStyle::Quick:
            return {0.12, 0.04};
        case AnimationStyle::Rapid:
            return {0.06, 0.02};
    }
    return {0.25, 0.08};
}

const char* animation_style_name(AnimationStyle style)
{
    switch (style)
    {
        case AnimationStyle::Slow:
            return "slow";
        case AnimationStyle::Mellow:
            return "mellow";
        case AnimationStyle::Quick:
            return "quick";
        case AnimationStyle::Rapid:
            return "rapid";
    }
    return "mellow";
}

AnimationStyle parse_animation_style(std::string_view name)
{
    if (name == "slow")
        return AnimationStyle::Slow;
    if (name == "quick")
        return AnimationStyle::Quick;
    if (name == "rapid")
        return AnimationStyle::Rapid;
    return AnimationStyle::Mellow;
}

// ─── Serialization ──────────────────────────────────────────────────────────

namespace
{

const char* generation_mode_name(ZoomGenerationMode mode)
{
    return mode == ZoomGenerationMode::Replace ? "replace" : "merge";
}

ZoomGenerationMode parse_generation_mode(std::string_view name)
{
    return name == "replace" ? ZoomGenerationMode::Replace : ZoomGenerationMode::Merge;
}

}   // anonymous namespace

std::string EngineConfig::serialize() const
{
    std::ostringstream ss;
    bool               first = true;
    ss << "{\n";

    auto number = [&](std::string_view key, double v)
    {
        json::write_key(ss, key, first);
        json::write_number(ss, v);
    };
    auto boolean = [&](std::string_view key, bool v)
    {
        json::write_key(ss, key, first);
        ss << (v ? "true" : "false");
    };
    auto str = [&](std::string_view key, std::string_view v)
    {
        json::write_key(ss, key, first);
        json::write_string(ss, v);
    };

    number("min_keyframe_spacing_ms", min_keyframe_spacing_ms);
    number("trailing_keyframe_gap_ms", trailing_keyframe_gap_ms);
    number("lead_frames", lead_frames);
    number("default_frame_rate", default_frame_rate);
    boolean("auto_generate_cursor", auto_generate_cursor);
    boolean("auto_generate_zoom", auto_generate_zoom);
    str("zoom_generation", generation_mode_name(zoom_generation));
    str("cursor_default_easing", easing_name(cursor_default_easing));
    number("click_pulse_duration_ms", click_pulse.duration_ms);
    number("click_pulse_min_scale", click_pulse.min_scale);
    boolean("smooth_preview", smooth_preview);
    boolean("smooth_export", smooth_export);
    number("smooth_time", smooth_time);
    number("max_delta_seconds", max_delta_seconds);
    number("shape_min_dwell_ms", shape_min_dwell_ms);
    boolean("hide_when_static", visibility.hide_when_static);
    number("static_threshold_px", visibility.static_threshold_px);
    number("hide_after_ms", visibility.hide_after_ms);
    number("min_static_duration_ms", min_static_duration_ms);
    number("section_lookahead", static_cast<double>(section_lookahead));

    ss << "\n}\n";
    return ss.str();
}

bool EngineConfig::deserialize(const std::string& text)
{
    const auto obj = json::trim(text);
    if (!json::is_object(obj))
    {
        CURSORFX_LOG_WARN("config", "Engine config is not a JSON object");
        return false;
    }

    auto number = [&](std::string_view key, double& out)
    {
        if (auto v = json::read_number(obj, key))
            out = *v;
    };
    auto boolean = [&](std::string_view key, bool& out)
    {
        if (auto v = json::read_bool(obj, key))
            out = *v;
    };

    number("min_keyframe_spacing_ms", min_keyframe_spacing_ms);
    number("trailing_keyframe_gap_ms", trailing_keyframe_gap_ms);
    if (auto v = json::read_int(obj, "lead_frames", 0, MAX_LEAD_FRAMES))
        lead_frames = *v;
    number("default_frame_rate", default_frame_rate);
    boolean("auto_generate_cursor", auto_generate_cursor);
    boolean("auto_generate_zoom", auto_generate_zoom);
    if (auto v = json::read_string(obj, "zoom_generation"))
        zoom_generation = parse_generation_mode(*v);
    if (auto v = json::read_string(obj, "cursor_default_easing"))
        cursor_default_easing = parse_easing(*v);
    number("click_pulse_duration_ms", click_pulse.duration_ms);
    number("click_pulse_min_scale", click_pulse.min_scale);
    boolean("smooth_preview", smooth_preview);
    boolean("smooth_export", smooth_export);
    number("smooth_time", smooth_time);
    number("max_delta_seconds", max_delta_seconds);
    number("shape_min_dwell_ms", shape_min_dwell_ms);
    boolean("hide_when_static", visibility.hide_when_static);
    number("static_threshold_px", visibility.static_threshold_px);
    number("hide_after_ms", visibility.hide_after_ms);
    number("min_static_duration_ms", min_static_duration_ms);
    if (auto v = json::read_number(obj, "section_lookahead"); v && *v >= 0.0)
        section_lookahead = static_cast<size_t>(*v);

    return true;
}

// ─── File I/O ───────────────────────────────────────────────────────────────

bool EngineConfig::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            CURSORFX_LOG_WARN("config", "Cannot create {}: {}", dir.string(), ec.message());
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        CURSORFX_LOG_ERROR("config", "Cannot open {} for writing", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool EngineConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(text))
        return false;
    CURSORFX_LOG_INFO("config", "Loaded engine config from {}", path);
    return true;
}

std::string EngineConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "engine.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "cursorfx";
    return (dir / "engine.json").string();
}

}   // namespace cursorfx
