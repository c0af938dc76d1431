#include <algorithm>
#include <cursorfx/easing.hpp>

namespace cursorfx
{

namespace ease
{

double linear(double t)
{
    return t;
}

double ease_in(double t)
{
    // Cubic ease-in
    return t * t * t;
}

double ease_out(double t)
{
    // Cubic ease-out
    double u = 1.0 - t;
    return 1.0 - u * u * u;
}

double ease_in_out(double t)
{
    // Quadratic ease-in-out
    if (t < 0.5)
    {
        return 2.0 * t * t;
    }
    double u = -2.0 * t + 2.0;
    return 1.0 - u * u / 2.0;
}

}   // namespace ease

EasingFn easing_fn(Easing easing)
{
    switch (easing)
    {
        case Easing::Linear:
            return ease::linear;
        case Easing::EaseIn:
            return ease::ease_in;
        case Easing::EaseOut:
            return ease::ease_out;
        case Easing::EaseInOut:
        default:
            return ease::ease_in_out;
    }
}

double apply_easing(Easing easing, double t)
{
    t = std::clamp(t, 0.0, 1.0);
    // Endpoints are exact for every curve so keyframe values are hit bit-for-bit.
    if (t <= 0.0)
        return 0.0;
    if (t >= 1.0)
        return 1.0;
    return easing_fn(easing)(t);
}

const char* easing_name(Easing easing)
{
    switch (easing)
    {
        case Easing::Linear:
            return "linear";
        case Easing::EaseIn:
            return "easeIn";
        case Easing::EaseOut:
            return "easeOut";
        case Easing::EaseInOut:
            return "easeInOut";
    }
    return "easeInOut";
}

Easing parse_easing(std::string_view name)
{
    if (name == "linear")
        return Easing::Linear;
    if (name == "easeIn" || name == "ease-in")
        return Easing::EaseIn;
    if (name == "easeOut" || name == "ease-out")
        return Easing::EaseOut;
    if (name == "easeInOut" || name == "ease-in-out")
        return Easing::EaseInOut;
    return DEFAULT_EASING;
}

}   // namespace cursorfx
