#include <algorithm>
#include <cursorfx/interpolator.hpp>
#include <cursorfx/logger.hpp>
#include <cursorfx/metadata.hpp>
#include <cursorfx/zoom_path.hpp>

namespace cursorfx
{

MetadataDocument::MetadataDocument(RecordingMetadata metadata) : metadata_(std::move(metadata))
{
    normalize_keyframes(metadata_.cursor.keyframes);
    normalize_keyframes(metadata_.zoom.keyframes);
}

void MetadataDocument::set_metadata(RecordingMetadata metadata)
{
    metadata_ = std::move(metadata);
    normalize_keyframes(metadata_.cursor.keyframes);
    normalize_keyframes(metadata_.zoom.keyframes);
    notify_change();
}

MetadataDocument::CallbackId MetadataDocument::on_change(ChangeCallback cb)
{
    const CallbackId id = next_callback_id_++;
    callbacks_.emplace_back(id, std::move(cb));
    return id;
}

void MetadataDocument::remove_on_change(CallbackId id)
{
    std::erase_if(callbacks_, [id](const auto& entry) { return entry.first == id; });
}

void MetadataDocument::notify_change()
{
    for (auto& [id, cb] : callbacks_)
    {
        if (cb)
            cb(metadata_);
    }
}

// ─── Zoom sections ──────────────────────────────────────────────────────────

namespace
{

void sort_sections(std::vector<ZoomSection>& sections)
{
    std::stable_sort(sections.begin(),
                     sections.end(),
                     [](const ZoomSection& a, const ZoomSection& b)
                     { return a.start_time < b.start_time; });
}

}   // anonymous namespace

void MetadataDocument::add_zoom_section(const ZoomSection& section)
{
    metadata_.zoom.sections.push_back(section);
    sort_sections(metadata_.zoom.sections);
    notify_change();
    CURSORFX_LOG_INFO("metadata",
                      "Added zoom section: {}ms - {}ms",
                      section.start_time,
                      section.end_time);
}

bool MetadataDocument::remove_zoom_section(TimeMs start_time)
{
    auto& sections = metadata_.zoom.sections;
    auto  it       = std::find_if(sections.begin(),
                           sections.end(),
                           [start_time](const ZoomSection& s) { return s.start_time == start_time; });
    if (it == sections.end())
        return false;
    sections.erase(it);
    notify_change();
    CURSORFX_LOG_INFO("metadata", "Removed zoom section at {}ms", start_time);
    return true;
}

bool MetadataDocument::update_zoom_section(TimeMs                                   start_time,
                                           const std::function<void(ZoomSection&)>& fn)
{
    auto& sections = metadata_.zoom.sections;
    auto  it       = std::find_if(sections.begin(),
                           sections.end(),
                           [start_time](const ZoomSection& s) { return s.start_time == start_time; });
    if (it == sections.end())
        return false;
    fn(*it);
    sort_sections(sections);
    notify_change();
    CURSORFX_LOG_INFO("metadata", "Updated zoom section at {}ms", start_time);
    return true;
}

void MetadataDocument::set_zoom_sections(std::vector<ZoomSection> sections)
{
    sort_sections(sections);
    metadata_.zoom.sections = std::move(sections);
    notify_change();
}

void MetadataDocument::convert_sections_to_keyframes()
{
    if (metadata_.zoom.sections.empty())
        return;
    const auto video         = metadata_.video.size();
    metadata_.zoom.keyframes = sections_to_keyframes(metadata_.zoom.sections,
                                                     video,
                                                     metadata_.zoom.config.transition_speed);
    for (auto& kf : metadata_.zoom.keyframes)
    {
        kf.crop_width  = zoom_crop_width(kf, video);
        kf.crop_height = zoom_crop_height(kf, video);
    }
    CURSORFX_LOG_INFO("metadata",
                      "Converted {} zoom sections to {} keyframes",
                      metadata_.zoom.sections.size(),
                      metadata_.zoom.keyframes.size());
    metadata_.zoom.sections.clear();
    notify_change();
}

// ─── Keyframes ──────────────────────────────────────────────────────────────

template <typename K, typename Fn>
bool MetadataDocument::edit_track(std::vector<K>& keyframes, Fn&& fn)
{
    KeyframeTrack<K> track(std::move(keyframes));
    const bool       changed = fn(track);
    keyframes                = track.keyframes();
    if (changed)
        notify_change();
    return changed;
}

void MetadataDocument::add_cursor_keyframe(const CursorKeyframe& kf)
{
    edit_track(metadata_.cursor.keyframes,
               [&](CursorTimeline& track)
               {
                   track.add_keyframe(kf);
                   return true;
               });
}

bool MetadataDocument::remove_cursor_keyframe(TimeMs t, TimeMs tolerance)
{
    return edit_track(metadata_.cursor.keyframes,
                      [&](CursorTimeline& track) { return track.remove_keyframe(t, tolerance); });
}

bool MetadataDocument::update_cursor_keyframe(TimeMs                                      t,
                                              const std::function<void(CursorKeyframe&)>& fn,
                                              TimeMs tolerance)
{
    return edit_track(metadata_.cursor.keyframes,
                      [&](CursorTimeline& track) { return track.update_keyframe(t, fn, tolerance); });
}

void MetadataDocument::add_zoom_keyframe(ZoomKeyframe kf)
{
    const auto video = metadata_.video.size();
    if (!kf.crop_width)
        kf.crop_width = zoom_crop_width(kf, video);
    if (!kf.crop_height)
        kf.crop_height = zoom_crop_height(kf, video);

    edit_track(metadata_.zoom.keyframes,
               [&](ZoomTimeline& track)
               {
                   track.add_keyframe(kf);
                   return true;
               });
}

bool MetadataDocument::remove_zoom_keyframe(TimeMs t, TimeMs tolerance)
{
    return edit_track(metadata_.zoom.keyframes,
                      [&](ZoomTimeline& track) { return track.remove_keyframe(t, tolerance); });
}

bool MetadataDocument::update_zoom_keyframe(TimeMs                                    t,
                                            const std::function<void(ZoomKeyframe&)>& fn,
                                            TimeMs                                    tolerance)
{
    return edit_track(metadata_.zoom.keyframes,
                      [&](ZoomTimeline& track) { return track.update_keyframe(t, fn, tolerance); });
}

// ─── Config ─────────────────────────────────────────────────────────────────

void MetadataDocument::update_cursor_config(const std::function<void(CursorConfig&)>& fn)
{
    fn(metadata_.cursor.config);
    notify_change();
}

void MetadataDocument::update_zoom_config(const std::function<void(ZoomConfig&)>& fn)
{
    fn(metadata_.zoom.config);
    notify_change();
}

// ─── Persistence ────────────────────────────────────────────────────────────

bool MetadataDocument::load(const std::string& path)
{
    auto m = load_metadata(path);
    if (!m)
        return false;
    set_metadata(std::move(*m));
    return true;
}

bool MetadataDocument::save(const std::string& path) const
{
    return save_metadata(metadata_, path);
}

}   // namespace cursorfx
