#include <algorithm>
#include <cursorfx/shape_stabilizer.hpp>
#include <limits>

namespace cursorfx
{

ShapeStabilizer::ShapeStabilizer(CursorShape initial, TimeMs min_dwell)
    : initial_(initial), committed_(initial), min_dwell_(std::max(0.0, min_dwell))
{
}

void ShapeStabilizer::set_keyframes(std::span<const CursorKeyframe> keyframes)
{
    runs_.clear();
    for (const auto& kf : keyframes)
    {
        if (!kf.shape)
            continue;
        if (!runs_.empty() && runs_.back().shape == *kf.shape)
            continue;
        if (!runs_.empty())
            runs_.back().end = kf.timestamp;
        runs_.push_back({kf.timestamp, std::numeric_limits<TimeMs>::infinity(), *kf.shape});
    }
    pending_.reset();
}

const ShapeStabilizer::ShapeRun* ShapeStabilizer::run_at(TimeMs t) const
{
    auto it = std::upper_bound(runs_.begin(),
                               runs_.end(),
                               t,
                               [](TimeMs time, const ShapeRun& r) { return time < r.start; });
    if (it == runs_.begin())
        return nullptr;
    return &*std::prev(it);
}

CursorShape ShapeStabilizer::update(CursorShape raw, TimeMs t)
{
    if (raw == committed_)
    {
        pending_.reset();
        return committed_;
    }

    // Look-ahead path: the raw shape belongs to a known run.
    const ShapeRun* run = run_at(t);
    if (run && run->shape == raw)
    {
        if (run->end - run->start >= min_dwell_)
            committed_ = raw;
        pending_.reset();
        return committed_;
    }

    // Dwell path: raw shape does not come from the keyframes.
    if (!pending_ || *pending_ != raw || t < pending_since_)
    {
        pending_       = raw;
        pending_since_ = t;
    }
    if (t - pending_since_ >= min_dwell_)
    {
        committed_ = raw;
        pending_.reset();
    }
    return committed_;
}

void ShapeStabilizer::reset(CursorShape shape)
{
    committed_ = shape;
    pending_.reset();
}

void ShapeStabilizer::reset_at(TimeMs t)
{
    pending_.reset();
    committed_ = initial_;

    const ShapeRun* run = run_at(t);
    if (!run)
        return;
    for (const ShapeRun* r = run;; --r)
    {
        if (r->end - r->start >= min_dwell_)
        {
            committed_ = r->shape;
            return;
        }
        if (r == runs_.data())
            return;
    }
}

}   // namespace cursorfx
