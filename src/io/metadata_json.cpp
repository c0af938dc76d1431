#include <algorithm>
#include <cursorfx/logger.hpp>
#include <cursorfx/metadata.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include "io/json.hpp"

namespace cursorfx
{

bool operator==(const VideoInfo& a, const VideoInfo& b)
{
    return a.path == b.path && a.width == b.width && a.height == b.height
           && a.frame_rate == b.frame_rate && a.duration == b.duration;
}

bool operator==(const RecordingMetadata& a, const RecordingMetadata& b)
{
    return a.version == b.version && a.video == b.video
           && a.cursor.keyframes == b.cursor.keyframes && a.cursor.config == b.cursor.config
           && a.zoom.keyframes == b.zoom.keyframes && a.zoom.sections == b.zoom.sections
           && a.zoom.config == b.zoom.config && a.clicks == b.clicks
           && a.effects == b.effects && a.created_at == b.created_at;
}

namespace
{

constexpr int MAX_TRAIL_LENGTH = 1000;

// ─── Writers ────────────────────────────────────────────────────────────────

// Small member writer over one JSON object.
class ObjectWriter
{
   public:
    explicit ObjectWriter(std::ostringstream& ss) : ss_(ss) { ss_ << '{'; }
    ~ObjectWriter() { ss_ << '}'; }

    ObjectWriter(const ObjectWriter&)            = delete;
    ObjectWriter& operator=(const ObjectWriter&) = delete;

    void number(std::string_view key, double v)
    {
        json::write_key(ss_, key, first_);
        json::write_number(ss_, v);
    }

    void string(std::string_view key, std::string_view v)
    {
        json::write_key(ss_, key, first_);
        json::write_string(ss_, v);
    }

    void boolean(std::string_view key, bool v)
    {
        json::write_key(ss_, key, first_);
        ss_ << (v ? "true" : "false");
    }

    // Key only; the caller writes the value.
    std::ostringstream& member(std::string_view key)
    {
        json::write_key(ss_, key, first_);
        return ss_;
    }

   private:
    std::ostringstream& ss_;
    bool                first_ = true;
};

template <typename T, typename Fn>
void write_array(std::ostringstream& ss, const std::vector<T>& items, Fn&& write_item)
{
    ss << '[';
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
            ss << ',';
        write_item(ss, items[i]);
    }
    ss << ']';
}

void write_cursor_keyframe(std::ostringstream& ss, const CursorKeyframe& kf)
{
    ObjectWriter w(ss);
    w.number("timestamp", kf.timestamp);
    w.number("x", kf.x);
    w.number("y", kf.y);
    if (kf.size)
        w.number("size", *kf.size);
    if (kf.shape)
        w.string("shape", cursor_shape_name(*kf.shape));
    if (kf.color)
        w.string("color", *kf.color);
    if (kf.easing)
        w.string("easing", easing_name(*kf.easing));
}

void write_zoom_keyframe(std::ostringstream& ss, const ZoomKeyframe& kf)
{
    ObjectWriter w(ss);
    w.number("timestamp", kf.timestamp);
    w.number("centerX", kf.center_x);
    w.number("centerY", kf.center_y);
    w.number("level", kf.level);
    if (kf.crop_width)
        w.number("cropWidth", *kf.crop_width);
    if (kf.crop_height)
        w.number("cropHeight", *kf.crop_height);
    if (kf.easing)
        w.string("easing", easing_name(*kf.easing));
}

void write_section(std::ostringstream& ss, const ZoomSection& s)
{
    ObjectWriter w(ss);
    w.number("startTime", s.start_time);
    w.number("endTime", s.end_time);
    w.number("scale", s.scale);
    w.number("centerX", s.center_x);
    w.number("centerY", s.center_y);
}

void write_click(std::ostringstream& ss, const ClickEvent& c)
{
    ObjectWriter w(ss);
    w.number("timestamp", c.timestamp);
    w.number("x", c.x);
    w.number("y", c.y);
    w.string("button", mouse_button_name(c.button));
    w.string("action", mouse_action_name(c.action));
}

void write_cursor_config(std::ostringstream& ss, const CursorConfig& c)
{
    ObjectWriter w(ss);
    w.number("size", c.size);
    w.string("shape", cursor_shape_name(c.shape));
    w.number("smoothing", c.smoothing);
    if (c.color)
        w.string("color", *c.color);
    w.boolean("hideWhenStatic", c.hide_when_static);
    if (c.animation_style)
        w.string("animationStyle", animation_style_name(*c.animation_style));
}

void write_zoom_config(std::ostringstream& ss, const ZoomConfig& c)
{
    ObjectWriter w(ss);
    w.boolean("enabled", c.enabled);
    w.number("level", c.level);
    w.number("transitionSpeed", c.transition_speed);
    w.number("padding", c.padding);
    w.number("followSpeed", c.follow_speed);
    w.number("deadZone", c.dead_zone);
    if (c.smoothness)
        w.string("smoothness", *c.smoothness);
}

void write_effects(std::ostringstream& ss, const MouseEffectsConfig& e)
{
    ObjectWriter w(ss);
    {
        ObjectWriter circles(w.member("clickCircles"));
        circles.boolean("enabled", e.click_circles.enabled);
        circles.number("size", e.click_circles.size);
        circles.string("color", e.click_circles.color);
        circles.number("duration", e.click_circles.duration);
    }
    {
        ObjectWriter trail(w.member("trail"));
        trail.boolean("enabled", e.trail.enabled);
        trail.number("length", e.trail.length);
        trail.number("fadeSpeed", e.trail.fade_speed);
        trail.string("color", e.trail.color);
    }
    {
        ObjectWriter ring(w.member("highlightRing"));
        ring.boolean("enabled", e.highlight_ring.enabled);
        ring.number("size", e.highlight_ring.size);
        ring.string("color", e.highlight_ring.color);
        ring.number("pulseSpeed", e.highlight_ring.pulse_speed);
    }
}

// ─── Readers ────────────────────────────────────────────────────────────────

template <typename T, typename Fn>
std::vector<T> read_array(std::string_view object, std::string_view key, Fn&& read_item)
{
    std::vector<T> out;
    auto           raw = json::find_member(object, key);
    if (!raw || !json::is_array(*raw))
        return out;
    for (auto element : json::array_elements(*raw))
    {
        if (auto item = read_item(element))
            out.push_back(std::move(*item));
    }
    return out;
}

std::optional<CursorKeyframe> read_cursor_keyframe(std::string_view obj)
{
    if (!json::is_object(obj))
        return std::nullopt;
    auto t = json::read_number(obj, "timestamp");
    auto x = json::read_number(obj, "x");
    auto y = json::read_number(obj, "y");
    if (!t || !x || !y)
        return std::nullopt;

    CursorKeyframe kf(*t, *x, *y);
    kf.size = json::read_number(obj, "size");
    if (auto s = json::read_string(obj, "shape"))
        kf.shape = parse_cursor_shape(*s);
    kf.color = json::read_string(obj, "color");
    if (auto e = json::read_string(obj, "easing"))
        kf.easing = parse_easing(*e);
    return kf;
}

std::optional<ZoomKeyframe> read_zoom_keyframe(std::string_view obj)
{
    if (!json::is_object(obj))
        return std::nullopt;
    auto t = json::read_number(obj, "timestamp");
    if (!t)
        return std::nullopt;

    ZoomKeyframe kf(*t,
                    json::read_number(obj, "centerX").value_or(0.0),
                    json::read_number(obj, "centerY").value_or(0.0),
                    json::read_number(obj, "level").value_or(1.0));
    kf.crop_width  = json::read_number(obj, "cropWidth");
    kf.crop_height = json::read_number(obj, "cropHeight");
    if (auto e = json::read_string(obj, "easing"))
        kf.easing = parse_easing(*e);
    return kf;
}

std::optional<ZoomSection> read_section(std::string_view obj)
{
    if (!json::is_object(obj))
        return std::nullopt;
    auto start = json::read_number(obj, "startTime");
    auto end   = json::read_number(obj, "endTime");
    if (!start || !end)
        return std::nullopt;

    ZoomSection s;
    s.start_time = *start;
    s.end_time   = *end;
    s.scale      = json::read_number(obj, "scale").value_or(1.0);
    s.center_x   = json::read_number(obj, "centerX").value_or(0.0);
    s.center_y   = json::read_number(obj, "centerY").value_or(0.0);
    return s;
}

std::optional<ClickEvent> read_click(std::string_view obj)
{
    if (!json::is_object(obj))
        return std::nullopt;
    auto t = json::read_number(obj, "timestamp");
    if (!t)
        return std::nullopt;

    ClickEvent c;
    c.timestamp = *t;
    c.x         = json::read_number(obj, "x").value_or(0.0);
    c.y         = json::read_number(obj, "y").value_or(0.0);
    if (auto b = json::read_string(obj, "button"))
        c.button = parse_mouse_button(*b);
    if (auto a = json::read_string(obj, "action"))
        c.action = parse_mouse_action(*a);
    return c;
}

void read_cursor_config(std::string_view obj, CursorConfig& c)
{
    if (!json::is_object(obj))
        return;
    if (auto v = json::read_number(obj, "size"))
        c.size = *v;
    if (auto v = json::read_string(obj, "shape"))
        c.shape = parse_cursor_shape(*v);
    if (auto v = json::read_number(obj, "smoothing"))
        c.smoothing = *v;
    c.color = json::read_string(obj, "color");
    if (auto v = json::read_bool(obj, "hideWhenStatic"))
        c.hide_when_static = *v;
    if (auto v = json::read_string(obj, "animationStyle"))
        c.animation_style = parse_animation_style(*v);
}

void read_zoom_config(std::string_view obj, ZoomConfig& c)
{
    if (!json::is_object(obj))
        return;
    if (auto v = json::read_bool(obj, "enabled"))
        c.enabled = *v;
    if (auto v = json::read_number(obj, "level"))
        c.level = *v;
    if (auto v = json::read_number(obj, "transitionSpeed"))
        c.transition_speed = *v;
    if (auto v = json::read_number(obj, "padding"))
        c.padding = *v;
    if (auto v = json::read_number(obj, "followSpeed"))
        c.follow_speed = *v;
    if (auto v = json::read_number(obj, "deadZone"))
        c.dead_zone = *v;
    c.smoothness = json::read_string(obj, "smoothness");
}

// Missing sub-objects and fields keep their defaults.
MouseEffectsConfig read_effects(std::string_view obj)
{
    MouseEffectsConfig e;
    if (auto circles = json::find_member(obj, "clickCircles"); circles && json::is_object(*circles))
    {
        auto& c = e.click_circles;
        c.enabled  = json::read_bool(*circles, "enabled").value_or(c.enabled);
        c.size     = json::read_number(*circles, "size").value_or(c.size);
        c.color    = json::read_string(*circles, "color").value_or(c.color);
        c.duration = json::read_number(*circles, "duration").value_or(c.duration);
    }
    if (auto trail = json::find_member(obj, "trail"); trail && json::is_object(*trail))
    {
        auto& t = e.trail;
        t.enabled    = json::read_bool(*trail, "enabled").value_or(t.enabled);
        t.length     = json::read_int(*trail, "length", 0, MAX_TRAIL_LENGTH).value_or(t.length);
        t.fade_speed = json::read_number(*trail, "fadeSpeed").value_or(t.fade_speed);
        t.color      = json::read_string(*trail, "color").value_or(t.color);
    }
    if (auto ring = json::find_member(obj, "highlightRing"); ring && json::is_object(*ring))
    {
        auto& r = e.highlight_ring;
        r.enabled     = json::read_bool(*ring, "enabled").value_or(r.enabled);
        r.size        = json::read_number(*ring, "size").value_or(r.size);
        r.color       = json::read_string(*ring, "color").value_or(r.color);
        r.pulse_speed = json::read_number(*ring, "pulseSpeed").value_or(r.pulse_speed);
    }
    return e;
}

}   // anonymous namespace

// ─── Document codec ─────────────────────────────────────────────────────────

std::string serialize_metadata(const RecordingMetadata& m)
{
    std::ostringstream ss;
    {
        ObjectWriter root(ss);
        root.string("version", m.version);

        {
            ObjectWriter video(root.member("video"));
            video.string("path", m.video.path);
            video.number("width", m.video.width);
            video.number("height", m.video.height);
            video.number("frameRate", m.video.frame_rate);
            video.number("duration", m.video.duration);
        }

        {
            ObjectWriter cursor(root.member("cursor"));
            write_array(cursor.member("keyframes"), m.cursor.keyframes, write_cursor_keyframe);
            write_cursor_config(cursor.member("config"), m.cursor.config);
        }

        {
            ObjectWriter zoom(root.member("zoom"));
            write_array(zoom.member("keyframes"), m.zoom.keyframes, write_zoom_keyframe);
            write_array(zoom.member("sections"), m.zoom.sections, write_section);
            write_zoom_config(zoom.member("config"), m.zoom.config);
        }

        if (m.effects)
            write_effects(root.member("effects"), *m.effects);

        write_array(root.member("clicks"), m.clicks, write_click);
        root.member("createdAt") << m.created_at;
    }
    ss << '\n';
    return ss.str();
}

std::optional<RecordingMetadata> parse_metadata(std::string_view text)
{
    const auto root = json::trim(text);
    if (!json::is_object(root))
    {
        CURSORFX_LOG_WARN("metadata", "Metadata is not a JSON object");
        return std::nullopt;
    }

    auto video = json::find_member(root, "video");
    if (!video || !json::is_object(*video))
    {
        CURSORFX_LOG_WARN("metadata", "Metadata has no video section");
        return std::nullopt;
    }

    RecordingMetadata m;
    m.version = json::read_string(root, "version").value_or(METADATA_VERSION);

    m.video.path       = json::read_string(*video, "path").value_or("");
    m.video.width      = json::read_number(*video, "width").value_or(0.0);
    m.video.height     = json::read_number(*video, "height").value_or(0.0);
    m.video.frame_rate = json::read_number(*video, "frameRate").value_or(30.0);
    m.video.duration   = json::read_number(*video, "duration").value_or(0.0);

    if (auto cursor = json::find_member(root, "cursor"); cursor && json::is_object(*cursor))
    {
        m.cursor.keyframes =
            read_array<CursorKeyframe>(*cursor, "keyframes", read_cursor_keyframe);
        if (auto cfg = json::find_member(*cursor, "config"))
            read_cursor_config(*cfg, m.cursor.config);
    }

    if (auto zoom = json::find_member(root, "zoom"); zoom && json::is_object(*zoom))
    {
        m.zoom.keyframes = read_array<ZoomKeyframe>(*zoom, "keyframes", read_zoom_keyframe);
        m.zoom.sections  = read_array<ZoomSection>(*zoom, "sections", read_section);
        if (auto cfg = json::find_member(*zoom, "config"))
            read_zoom_config(*cfg, m.zoom.config);
    }

    if (auto effects = json::find_member(root, "effects"); effects && json::is_object(*effects))
        m.effects = read_effects(*effects);

    m.clicks     = read_array<ClickEvent>(root, "clicks", read_click);
    m.created_at = static_cast<int64_t>(json::read_number(root, "createdAt").value_or(0.0));

    CURSORFX_LOG_DEBUG("metadata",
                       "Parsed metadata: {} cursor keyframes, {} zoom keyframes, {} sections, {} clicks",
                       m.cursor.keyframes.size(),
                       m.zoom.keyframes.size(),
                       m.zoom.sections.size(),
                       m.clicks.size());
    return m;
}

// ─── File I/O ───────────────────────────────────────────────────────────────

std::optional<RecordingMetadata> load_metadata(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        CURSORFX_LOG_WARN("metadata", "Cannot open {}", path);
        return std::nullopt;
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    auto        m = parse_metadata(text);
    if (m)
        CURSORFX_LOG_INFO("metadata", "Loaded metadata from {}", path);
    return m;
}

bool save_metadata(const RecordingMetadata& metadata, const std::string& path)
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            CURSORFX_LOG_WARN("metadata", "Cannot create {}: {}", dir.string(), ec.message());
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        CURSORFX_LOG_WARN("metadata", "Cannot open {} for writing", path);
        return false;
    }
    f << serialize_metadata(metadata);
    if (!f.good())
        return false;
    CURSORFX_LOG_INFO("metadata", "Saved metadata to {}", path);
    return true;
}

// ─── Frame offset ───────────────────────────────────────────────────────────

RecordingMetadata apply_frame_offset(const RecordingMetadata& metadata, double frames)
{
    RecordingMetadata out = metadata;
    if (metadata.video.frame_rate <= 0.0)
        return out;

    const TimeMs offset = frames * 1000.0 / metadata.video.frame_rate;
    auto         shift  = [offset](TimeMs t) { return std::max(0.0, t + offset); };

    for (auto& kf : out.cursor.keyframes)
        kf.timestamp = shift(kf.timestamp);
    for (auto& kf : out.zoom.keyframes)
        kf.timestamp = shift(kf.timestamp);
    for (auto& s : out.zoom.sections)
    {
        s.start_time = shift(s.start_time);
        s.end_time   = shift(s.end_time);
    }
    for (auto& c : out.clicks)
        c.timestamp = shift(c.timestamp);

    CURSORFX_LOG_DEBUG("metadata", "Applied frame offset of {} frames ({} ms)", frames, offset);
    return out;
}

}   // namespace cursorfx
