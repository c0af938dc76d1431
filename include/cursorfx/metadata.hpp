#pragma once

#include <cstdint>
#include <cursorfx/config.hpp>
#include <cursorfx/keyframe.hpp>
#include <cursorfx/timeline.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cursorfx
{

inline constexpr const char* METADATA_VERSION = "1.0.0";

struct VideoInfo
{
    std::string path;
    double      width      = 0.0;
    double      height     = 0.0;
    double      frame_rate = 30.0;
    TimeMs      duration   = 0.0;

    VideoSize size() const { return {width, height}; }
};

struct CursorTrack
{
    std::vector<CursorKeyframe> keyframes;
    CursorConfig                config;
};

struct ZoomTrack
{
    std::vector<ZoomKeyframe> keyframes;
    std::vector<ZoomSection>  sections;
    ZoomConfig                config;
};

// The persisted recording document, written next to the video as JSON.
struct RecordingMetadata
{
    std::string                       version = METADATA_VERSION;
    VideoInfo                         video;
    CursorTrack                       cursor;
    ZoomTrack                         zoom;
    std::optional<MouseEffectsConfig> effects;   // absent in documents without overlays
    std::vector<ClickEvent>           clicks;
    int64_t                           created_at = 0;   // ms since epoch
};

bool operator==(const VideoInfo& a, const VideoInfo& b);
bool operator==(const RecordingMetadata& a, const RecordingMetadata& b);

// ─── JSON ───────────────────────────────────────────────────────────────────

// Optional keyframe fields are omitted when unset so a parse/serialize
// round trip reproduces the document.
std::string serialize_metadata(const RecordingMetadata& metadata);

// nullopt when the text is not an object or lacks `video`. Missing
// sections fall back to defaults; malformed entries are skipped.
std::optional<RecordingMetadata> parse_metadata(std::string_view json);

std::optional<RecordingMetadata> load_metadata(const std::string& path);
bool                             save_metadata(const RecordingMetadata& metadata,
                                               const std::string&       path);

// Copy with every timestamp (cursor and zoom keyframes, sections, clicks)
// shifted by frames * 1000 / frame_rate ms, clamped at 0.
RecordingMetadata apply_frame_offset(const RecordingMetadata& metadata, double frames);

// ─── Editing ────────────────────────────────────────────────────────────────

// Owns a RecordingMetadata and keeps its keyframe lists normalized across
// edits. Every successful edit notifies the change callbacks.
class MetadataDocument
{
   public:
    using ChangeCallback = std::function<void(const RecordingMetadata&)>;
    using CallbackId     = size_t;

    MetadataDocument() = default;
    explicit MetadataDocument(RecordingMetadata metadata);

    void set_metadata(RecordingMetadata metadata);
    const RecordingMetadata& metadata() const { return metadata_; }

    CallbackId on_change(ChangeCallback cb);
    void       remove_on_change(CallbackId id);

    // ─── Zoom sections ──────────────────────────────────────────────────

    void add_zoom_section(const ZoomSection& section);
    bool remove_zoom_section(TimeMs start_time);
    bool update_zoom_section(TimeMs start_time, const std::function<void(ZoomSection&)>& fn);
    void set_zoom_sections(std::vector<ZoomSection> sections);

    // Compile sections into zoom keyframes and drop the sections.
    void convert_sections_to_keyframes();

    // ─── Keyframes ──────────────────────────────────────────────────────

    void add_cursor_keyframe(const CursorKeyframe& kf);
    bool remove_cursor_keyframe(TimeMs t, TimeMs tolerance = MIN_KEYFRAME_SPACING_MS);
    bool update_cursor_keyframe(TimeMs                                      t,
                                const std::function<void(CursorKeyframe&)>& fn,
                                TimeMs tolerance = MIN_KEYFRAME_SPACING_MS);

    // Fills crop_width/crop_height from the video size when absent.
    void add_zoom_keyframe(ZoomKeyframe kf);
    bool remove_zoom_keyframe(TimeMs t, TimeMs tolerance = MIN_KEYFRAME_SPACING_MS);
    bool update_zoom_keyframe(TimeMs                                    t,
                              const std::function<void(ZoomKeyframe&)>& fn,
                              TimeMs tolerance = MIN_KEYFRAME_SPACING_MS);

    // ─── Config ─────────────────────────────────────────────────────────

    void update_cursor_config(const std::function<void(CursorConfig&)>& fn);
    void update_zoom_config(const std::function<void(ZoomConfig&)>& fn);

    // ─── Persistence ────────────────────────────────────────────────────

    bool load(const std::string& path);
    bool save(const std::string& path) const;

   private:
    template <typename K, typename Fn>
    bool edit_track(std::vector<K>& keyframes, Fn&& fn);

    void notify_change();

    RecordingMetadata                                     metadata_;
    std::vector<std::pair<CallbackId, ChangeCallback>>    callbacks_;
    CallbackId                                            next_callback_id_ = 1;
};

}   // namespace cursorfx
