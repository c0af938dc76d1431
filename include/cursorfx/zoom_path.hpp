#pragma once

#include <cstdint>
#include <cursorfx/config.hpp>
#include <cursorfx/keyframe.hpp>
#include <optional>
#include <span>
#include <vector>

namespace cursorfx
{

// ─── Geometry ───────────────────────────────────────────────────────────────

// Crop of video / level around (x, y), with the centre clamped so the crop
// stays inside the frame. Levels below 1 are treated as 1.
ZoomRegion compute_zoom_region(double           x,
                               double           y,
                               const VideoSize& video,
                               double           level,
                               TimeMs           timestamp = 0.0);

// Number of frames covering duration_ms at frame_rate:
// ceil(duration / (1000 / frame_rate)). Zero for non-positive or
// non-finite inputs.
size_t frame_count_for(TimeMs duration_ms, double frame_rate);

// Presentation time of frame `index`.
TimeMs frame_time(size_t index, double frame_rate);

// Region for time t from a per-frame array: index floor(t / interval),
// clamped into the array. nullopt when the array is empty or frame_rate is
// not positive.
std::optional<ZoomRegion> zoom_region_at(std::span<const ZoomRegion> regions,
                                         TimeMs                      t,
                                         double                      frame_rate);

// ─── Sections ───────────────────────────────────────────────────────────────

// Compile coarse sections into a zoom keyframe timeline: each section gets
// an ease-in-out transition of `transition_ms` (at most half the section)
// from the preceding state, holds until its end, then eases back to the
// identity zoom unless the next section starts within transition_ms.
// Overlapping sections are clipped to the start of the following one.
std::vector<ZoomKeyframe> sections_to_keyframes(std::span<const ZoomSection> sections,
                                                const VideoSize&             video,
                                                TimeMs                       transition_ms);

// Split raw pointer telemetry into alternating static / moving sections.
// Static sections zoom to zoom.level on their anchor; moving sections are
// identity (scale 1, frame centre).
std::vector<ZoomSection> detect_zoom_sections(std::span<const MouseEvent> events,
                                              const VideoSize&            video,
                                              const ZoomConfig&           zoom,
                                              const EngineConfig&         engine = {});

// ─── Per-frame path ─────────────────────────────────────────────────────────

// Materializes the per-frame zoom path for a section list and memoizes it.
// Preview (time -> frame index) and export (frame index loop) both read
// the same array, so they see identical zoom per frame.
//
// Owned by one consumer; not thread-safe.
class ZoomPathGenerator
{
   public:
    ZoomPathGenerator() = default;

    // Returns the cached array when the structural key of the inputs is
    // unchanged, otherwise rebuilds it. The reference stays valid until the
    // next call that rebuilds, or invalidate().
    const std::vector<ZoomRegion>& generate(std::span<const ZoomSection> sections,
                                            const VideoSize&             video,
                                            const ZoomConfig&            config,
                                            double                       frame_rate,
                                            TimeMs                       duration_ms);

    void invalidate();

    bool                           has_cache() const { return key_.has_value(); }
    const std::vector<ZoomRegion>& regions() const { return regions_; }

    // How many times the O(frames) build actually ran.
    size_t computation_count() const { return computations_; }

    static uint64_t structural_hash(std::span<const ZoomSection> sections,
                                    const VideoSize&             video,
                                    const ZoomConfig&            config,
                                    double                       frame_rate,
                                    TimeMs                       duration_ms);

    // Uncached build.
    static std::vector<ZoomRegion> build(std::span<const ZoomSection> sections,
                                         const VideoSize&             video,
                                         const ZoomConfig&            config,
                                         double                       frame_rate,
                                         TimeMs                       duration_ms);

   private:
    struct CacheInputs
    {
        std::vector<ZoomSection> sections;
        VideoSize                video;
        bool                     enabled          = false;
        double                   level            = 0.0;
        TimeMs                   transition_speed = 0.0;
        double                   frame_rate       = 0.0;
        TimeMs                   duration_ms      = 0.0;
    };

    static bool same_inputs(const CacheInputs&           cached,
                            std::span<const ZoomSection> sections,
                            const VideoSize&             video,
                            const ZoomConfig&            config,
                            double                       frame_rate,
                            TimeMs                       duration_ms);

    std::optional<uint64_t> key_;
    CacheInputs             inputs_;
    std::vector<ZoomRegion> regions_;
    size_t                  computations_ = 0;
};

}   // namespace cursorfx
