#pragma once

#include <cstdint>
#include <string_view>

namespace cursorfx
{

namespace ease
{
double linear(double t);
double ease_in(double t);
double ease_out(double t);
double ease_in_out(double t);
}   // namespace ease

using EasingFn = double (*)(double);

// Easing curve attached to the start keyframe of a segment.
enum class Easing : uint8_t
{
    Linear,
    EaseIn,
    EaseOut,
    EaseInOut,
};

// Default curve for segments whose start keyframe carries none.
inline constexpr Easing DEFAULT_EASING = Easing::EaseInOut;

// Evaluate `easing` at normalized progress t. t is clamped to [0, 1].
double apply_easing(Easing easing, double t);

EasingFn easing_fn(Easing easing);

// Document name ("linear", "easeIn", "easeOut", "easeInOut").
const char* easing_name(Easing easing);

// Accepts both the document spelling ("easeIn") and the hyphenated one
// ("ease-in"). Anything unrecognized resolves to DEFAULT_EASING.
Easing parse_easing(std::string_view name);

}   // namespace cursorfx
