#include <algorithm>
#include <bit>
#include <cmath>
#include <cursorfx/interpolator.hpp>
#include <cursorfx/logger.hpp>
#include <cursorfx/zoom_path.hpp>

namespace cursorfx
{

// ─── Geometry ───────────────────────────────────────────────────────────────

ZoomRegion compute_zoom_region(double           x,
                               double           y,
                               const VideoSize& video,
                               double           level,
                               TimeMs           timestamp)
{
    const double lvl = (std::isfinite(level) && level >= 1.0) ? level : 1.0;

    ZoomRegion r;
    r.timestamp   = timestamp;
    r.level       = lvl;
    r.crop_width  = video.width / lvl;
    r.crop_height = video.height / lvl;

    const double min_x = r.crop_width * 0.5;
    const double max_x = video.width - r.crop_width * 0.5;
    const double min_y = r.crop_height * 0.5;
    const double max_y = video.height - r.crop_height * 0.5;

    // std::clamp requires lo <= hi; guard degenerate video sizes.
    r.center_x = (min_x <= max_x) ? std::clamp(x, min_x, max_x) : video.width * 0.5;
    r.center_y = (min_y <= max_y) ? std::clamp(y, min_y, max_y) : video.height * 0.5;
    return r;
}

size_t frame_count_for(TimeMs duration_ms, double frame_rate)
{
    if (!std::isfinite(duration_ms) || !std::isfinite(frame_rate))
        return 0;
    if (duration_ms <= 0.0 || frame_rate <= 0.0)
        return 0;
    const double interval = 1000.0 / frame_rate;
    return static_cast<size_t>(std::ceil(duration_ms / interval));
}

TimeMs frame_time(size_t index, double frame_rate)
{
    if (frame_rate <= 0.0)
        return 0.0;
    return static_cast<double>(index) * (1000.0 / frame_rate);
}

std::optional<ZoomRegion> zoom_region_at(std::span<const ZoomRegion> regions,
                                         TimeMs                      t,
                                         double                      frame_rate)
{
    if (regions.empty() || !(frame_rate > 0.0) || std::isnan(t))
        return std::nullopt;

    const double interval = 1000.0 / frame_rate;
    // Tolerate rounding in t = index * interval.
    const double idx      = std::floor(t / interval + 1e-9);
    if (idx <= 0.0)
        return regions.front();
    if (idx >= static_cast<double>(regions.size() - 1))
        return regions.back();
    return regions[static_cast<size_t>(idx)];
}

// ─── ZoomPathGenerator ──────────────────────────────────────────────────────

namespace
{

constexpr uint64_t FNV_OFFSET = 14695981039346656037ull;
constexpr uint64_t FNV_PRIME  = 1099511628211ull;

void hash_bits(uint64_t& h, uint64_t bits)
{
    for (int i = 0; i < 8; ++i)
    {
        h ^= (bits >> (i * 8)) & 0xFFu;
        h *= FNV_PRIME;
    }
}

void hash_double(uint64_t& h, double v)
{
    // +0.0 and -0.0 describe the same path.
    if (v == 0.0)
        v = 0.0;
    hash_bits(h, std::bit_cast<uint64_t>(v));
}

}   // anonymous namespace

uint64_t ZoomPathGenerator::structural_hash(std::span<const ZoomSection> sections,
                                            const VideoSize&             video,
                                            const ZoomConfig&            config,
                                            double                       frame_rate,
                                            TimeMs                       duration_ms)
{
    uint64_t h = FNV_OFFSET;
    hash_bits(h, config.enabled ? 1u : 0u);
    hash_double(h, config.level);
    hash_double(h, config.transition_speed);
    hash_double(h, video.width);
    hash_double(h, video.height);
    hash_double(h, frame_rate);
    hash_double(h, duration_ms);
    hash_bits(h, sections.size());
    for (const auto& s : sections)
    {
        hash_double(h, s.start_time);
        hash_double(h, s.end_time);
        hash_double(h, s.scale);
        hash_double(h, s.center_x);
        hash_double(h, s.center_y);
    }
    return h;
}

bool ZoomPathGenerator::same_inputs(const CacheInputs&           cached,
                                    std::span<const ZoomSection> sections,
                                    const VideoSize&             video,
                                    const ZoomConfig&            config,
                                    double                       frame_rate,
                                    TimeMs                       duration_ms)
{
    return cached.enabled == config.enabled && cached.level == config.level
           && cached.transition_speed == config.transition_speed
           && cached.video.width == video.width && cached.video.height == video.height
           && cached.frame_rate == frame_rate && cached.duration_ms == duration_ms
           && std::equal(cached.sections.begin(),
                         cached.sections.end(),
                         sections.begin(),
                         sections.end());
}

std::vector<ZoomRegion> ZoomPathGenerator::build(std::span<const ZoomSection> sections,
                                                 const VideoSize&             video,
                                                 const ZoomConfig&            config,
                                                 double                       frame_rate,
                                                 TimeMs                       duration_ms)
{
    const size_t frames = frame_count_for(duration_ms, frame_rate);
    std::vector<ZoomRegion> regions;
    regions.reserve(frames);

    if (!config.enabled || sections.empty())
    {
        for (size_t i = 0; i < frames; ++i)
            regions.push_back(identity_zoom(video, frame_time(i, frame_rate)));
        return regions;
    }

    const auto keyframes = sections_to_keyframes(sections, video, config.transition_speed);
    for (size_t i = 0; i < frames; ++i)
    {
        const TimeMs t = frame_time(i, frame_rate);
        const auto   z = interpolate_zoom(std::span<const ZoomKeyframe>(keyframes), t, video);
        regions.push_back(compute_zoom_region(z.center_x, z.center_y, video, z.level, t));
    }
    return regions;
}

const std::vector<ZoomRegion>& ZoomPathGenerator::generate(std::span<const ZoomSection> sections,
                                                           const VideoSize&             video,
                                                           const ZoomConfig&            config,
                                                           double                       frame_rate,
                                                           TimeMs                       duration_ms)
{
    const uint64_t key = structural_hash(sections, video, config, frame_rate, duration_ms);
    if (key_ && *key_ == key
        && same_inputs(inputs_, sections, video, config, frame_rate, duration_ms))
        return regions_;

    regions_ = build(sections, video, config, frame_rate, duration_ms);
    ++computations_;

    inputs_.sections.assign(sections.begin(), sections.end());
    inputs_.video            = video;
    inputs_.enabled          = config.enabled;
    inputs_.level            = config.level;
    inputs_.transition_speed = config.transition_speed;
    inputs_.frame_rate       = frame_rate;
    inputs_.duration_ms      = duration_ms;
    key_                     = key;

    CURSORFX_LOG_DEBUG("zoom",
                       "Built zoom path: {} frames from {} sections",
                       regions_.size(),
                       sections.size());
    return regions_;
}

void ZoomPathGenerator::invalidate()
{
    key_.reset();
    inputs_ = CacheInputs{};
    regions_.clear();
}

}   // namespace cursorfx
