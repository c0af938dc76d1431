#pragma once

#include <cursorfx/keyframe.hpp>
#include <span>

namespace cursorfx
{

struct ClickPulseConfig
{
    TimeMs duration_ms = 200.0;   // whole shrink + grow window
    double min_scale   = 0.7;     // scale at the middle of the window
};

// Transient cursor scale multiplier caused by the most recent `down` click
// with 0 <= t - click.timestamp <= duration_ms. First half shrinks from 1
// toward min_scale (ease-out), second half grows back to 1 (ease-in).
// Returns 1.0 when no click qualifies. Stateless.
double click_pulse_scale(TimeMs                      t,
                         std::span<const ClickEvent> clicks,
                         const ClickPulseConfig&     config = {});

}   // namespace cursorfx
