#pragma once

#include <string>
#include <vector>

namespace pulseplot::ui
{

struct TickResult
{
    std::vector<double>      positions;
    std::vector<std::string> labels;
};

// "Nice number" ticks: spacing of 1, 2 or 5 × 10^n, about `target_ticks`
// across [min, max].
TickResult generate_ticks(double min, double max, int target_ticks = 7);

// Shortest label that still distinguishes neighbouring ticks at `spacing`.
std::string format_tick_value(double value, double spacing);

}   // namespace pulseplot::ui
