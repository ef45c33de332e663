#include "ticks.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace pulseplot::ui
{

// Rounds x to 1, 2, 5 or 10 × 10^n.  `round_to_nearest` picks the closest
// nice value, otherwise the next one up.
static double nice_number(double x, bool round_to_nearest)
{
    double exponent = std::floor(std::log10(x));
    double fraction = x / std::pow(10.0, exponent);
    double nice;
    if (round_to_nearest)
    {
        if (fraction < 1.5)
            nice = 1.0;
        else if (fraction < 3.0)
            nice = 2.0;
        else if (fraction < 7.0)
            nice = 5.0;
        else
            nice = 10.0;
    }
    else
    {
        if (fraction <= 1.0)
            nice = 1.0;
        else if (fraction <= 2.0)
            nice = 2.0;
        else if (fraction <= 5.0)
            nice = 5.0;
        else
            nice = 10.0;
    }
    return nice * std::pow(10.0, exponent);
}

std::string format_tick_value(double value, double spacing)
{
    if (std::abs(value) < std::abs(spacing) * 1e-6)
        return "0";

    int decimals = 0;
    if (spacing > 0.0 && std::isfinite(spacing))
        decimals = std::max(0, static_cast<int>(std::ceil(-std::log10(spacing))));

    char buf[64];
    if (std::abs(value) >= 1e7 || decimals > 6)
        std::snprintf(buf, sizeof(buf), "%.3g", value);
    else
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

TickResult generate_ticks(double min, double max, int target_ticks)
{
    TickResult result;
    if (target_ticks < 2)
        target_ticks = 2;

    if (!std::isfinite(min) || !std::isfinite(max))
        return result;

    double range = max - min;
    if (range <= 0.0)
    {
        double half = std::abs(min) * 0.1;
        if (half == 0.0)
            half = 0.5;
        if (range == 0.0)
            return generate_ticks(min - half, min + half, target_ticks);
        result.positions.push_back(min);
        result.labels.push_back(format_tick_value(min, 1.0));
        return result;
    }

    double scale     = std::max(std::abs(min), std::abs(max));
    double min_range = scale * std::numeric_limits<double>::epsilon() * 16.0;
    if (range < min_range)
    {
        double mid = (min + max) * 0.5;
        result.positions.push_back(mid);
        result.labels.push_back(format_tick_value(mid, range));
        return result;
    }

    double spacing = nice_number(nice_number(range, false) / (target_ticks - 1), true);
    if (!(spacing > 0.0) || !std::isfinite(spacing))
        return result;

    double first = std::floor(min / spacing) * spacing;
    double last  = std::ceil(max / spacing) * spacing;

    // Bounded in case of pathological spacing
    const int max_ticks = target_ticks * 3;
    int       count     = 0;
    for (double v = first; v <= last + spacing * 0.5 && count < max_ticks; v += spacing, ++count)
    {
        if (v < min - spacing * 0.01 || v > max + spacing * 0.01)
            continue;
        if (std::abs(v) < spacing * 1e-6)
            v = 0.0;
        result.positions.push_back(v);
        result.labels.push_back(format_tick_value(v, spacing));
    }
    return result;
}

}   // namespace pulseplot::ui
