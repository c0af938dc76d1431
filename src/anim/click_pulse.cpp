#include <cursorfx/click_pulse.hpp>
#include <cursorfx/easing.hpp>

namespace cursorfx
{

double click_pulse_scale(TimeMs t, std::span<const ClickEvent> clicks, const ClickPulseConfig& config)
{
    if (config.duration_ms <= 0.0)
        return 1.0;

    const ClickEvent* latest = nullptr;
    for (const auto& click : clicks)
    {
        if (click.action != MouseAction::Down)
            continue;
        const TimeMs since = t - click.timestamp;
        if (since < 0.0 || since > config.duration_ms)
            continue;
        if (!latest || click.timestamp > latest->timestamp)
            latest = &click;
    }

    if (!latest)
        return 1.0;

    const double progress = (t - latest->timestamp) / config.duration_ms;
    const double depth    = 1.0 - config.min_scale;

    if (progress < 0.5)
    {
        const double e = ease::ease_out(progress * 2.0);
        return 1.0 - depth * e;
    }
    const double e = ease::ease_in((progress - 0.5) * 2.0);
    return config.min_scale + depth * e;
}

}   // namespace cursorfx
