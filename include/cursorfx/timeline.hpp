#pragma once

#include <algorithm>
#include <cmath>
#include <cursorfx/keyframe.hpp>
#include <functional>
#include <span>
#include <utility>
#include <vector>

namespace cursorfx
{

// Sort ascending by timestamp (stable) and merge neighbours closer than
// `spacing`: a single forward pass where a keyframe too close to the last
// retained one replaces it. Running it twice is a no-op.
template <typename K>
void normalize_keyframes(std::vector<K>& keyframes, TimeMs spacing = MIN_KEYFRAME_SPACING_MS)
{
    std::stable_sort(keyframes.begin(),
                     keyframes.end(),
                     [](const K& a, const K& b) { return a.timestamp < b.timestamp; });

    std::vector<K> kept;
    kept.reserve(keyframes.size());
    for (auto& kf : keyframes)
    {
        if (!kept.empty() && kf.timestamp - kept.back().timestamp < spacing)
        {
            kept.back() = std::move(kf);
            continue;
        }
        kept.push_back(std::move(kf));
    }
    keyframes = std::move(kept);
}

// Time-ordered keyframe sequence. Invariants after every mutation:
// sorted ascending by timestamp, no two entries closer than spacing().
// Not thread-safe; each consumer owns or copies its timeline.
template <typename K>
class KeyframeTrack
{
   public:
    using Keyframe = K;

    KeyframeTrack() = default;
    explicit KeyframeTrack(std::vector<K> keyframes, TimeMs spacing = MIN_KEYFRAME_SPACING_MS)
        : spacing_(spacing)
    {
        set_keyframes(std::move(keyframes));
    }

    // ─── Keyframe management ────────────────────────────────────────────

    // Replace the whole sequence (sort + dedup).
    void set_keyframes(std::vector<K> keyframes)
    {
        normalize_keyframes(keyframes, spacing_);
        keyframes_ = std::move(keyframes);
    }

    // Insert a keyframe. Existing keyframes within spacing() of it are replaced.
    void add_keyframe(const K& kf)
    {
        erase_within(kf.timestamp, spacing_);
        auto pos = std::upper_bound(keyframes_.begin(),
                                    keyframes_.end(),
                                    kf.timestamp,
                                    [](TimeMs t, const K& k) { return t < k.timestamp; });
        keyframes_.insert(pos, kf);
    }

    // Remove every keyframe within tolerance of time.
    bool remove_keyframe(TimeMs time, TimeMs tolerance = MIN_KEYFRAME_SPACING_MS)
    {
        return erase_within(time, tolerance) > 0;
    }

    // Apply `fn` to the keyframe nearest to time (within tolerance).
    // Re-sorts and re-dedups afterwards in case the timestamp moved.
    bool update_keyframe(TimeMs                        time,
                         const std::function<void(K&)>& fn,
                         TimeMs                        tolerance = MIN_KEYFRAME_SPACING_MS)
    {
        K* kf = find_keyframe(time, tolerance);
        if (!kf)
            return false;
        const TimeMs before = kf->timestamp;
        fn(*kf);
        if (kf->timestamp != before)
            normalize_keyframes(keyframes_, spacing_);
        return true;
    }

    void clear() { keyframes_.clear(); }

    // ─── Queries ────────────────────────────────────────────────────────

    K* find_keyframe(TimeMs time, TimeMs tolerance = MIN_KEYFRAME_SPACING_MS)
    {
        return const_cast<K*>(std::as_const(*this).find_keyframe(time, tolerance));
    }

    const K* find_keyframe(TimeMs time, TimeMs tolerance = MIN_KEYFRAME_SPACING_MS) const
    {
        const K* best      = nullptr;
        TimeMs   best_diff = tolerance;
        for (const auto& kf : keyframes_)
        {
            TimeMs diff = std::abs(kf.timestamp - time);
            if (diff < best_diff || (diff == 0.0 && !best))
            {
                best      = &kf;
                best_diff = diff;
            }
        }
        return best;
    }

    const std::vector<K>& keyframes() const { return keyframes_; }
    std::span<const K>    view() const { return keyframes_; }
    size_t                size() const { return keyframes_.size(); }
    bool                  empty() const { return keyframes_.empty(); }
    TimeMs                spacing() const { return spacing_; }

    TimeMs start_time() const { return keyframes_.empty() ? 0.0 : keyframes_.front().timestamp; }
    TimeMs end_time() const { return keyframes_.empty() ? 0.0 : keyframes_.back().timestamp; }

   private:
    size_t erase_within(TimeMs time, TimeMs tolerance)
    {
        auto it = std::remove_if(keyframes_.begin(),
                                 keyframes_.end(),
                                 [time, tolerance](const K& k)
                                 { return std::abs(k.timestamp - time) < tolerance; });
        size_t removed = static_cast<size_t>(std::distance(it, keyframes_.end()));
        keyframes_.erase(it, keyframes_.end());
        return removed;
    }

    std::vector<K> keyframes_;   // Always sorted by timestamp
    TimeMs         spacing_ = MIN_KEYFRAME_SPACING_MS;
};

using CursorTimeline = KeyframeTrack<CursorKeyframe>;
using ZoomTimeline   = KeyframeTrack<ZoomKeyframe>;

}   // namespace cursorfx
