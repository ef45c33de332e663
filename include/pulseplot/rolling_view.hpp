#pragma once

#include <cstddef>
#include <optional>
#include <pulseplot/sample.hpp>
#include <span>
#include <string>

namespace pulseplot
{

// How the y-axis follows the buffered values.
enum class YScalePolicy
{
    Padded,     // [min - padding, max + padding]
    Midpoint,   // mid ± max(floor, max - min) / divisor; steadier on noisy baselines
};

// What "now" means for the right edge of the window.
enum class XAnchor
{
    Clock,          // run clock, so the window keeps sliding when data stalls
    LatestSample,   // newest buffered timestamp
};

struct AxisRange
{
    double min = 0.0;
    double max = 1.0;
};

struct ViewBounds
{
    double                x_min = 0.0;
    double                x_max = 10.0;
    double                y_min = 0.0;
    double                y_max = 100.0;
    std::optional<double> rate_hz;   // nullopt = not enough samples yet
};

struct ViewConfig
{
    double       window_seconds   = 10.0;
    double       right_margin     = 0.5;
    YScalePolicy y_policy         = YScalePolicy::Midpoint;
    double       y_padding        = 10.0;   // Padded only
    double       y_range_floor    = 50.0;
    double       midpoint_divisor = 1.8;    // Midpoint only
    std::size_t  min_rate_samples = 10;     // rate needs strictly more than this
    XAnchor      x_anchor         = XAnchor::Clock;
    AxisRange    initial_x        = {0.0, 10.0};
    AxisRange    initial_y        = {0.0, 100.0};

    // Serial controller: integer ADC readings with a noisy baseline.
    static ViewConfig serial_preset();
    // Camera PPG proxy: mean 8-bit channel intensity.
    static ViewConfig camera_preset();
};

// Derives display bounds and an averaged sample rate from the buffer's
// current contents.  Stateless; safe to call every tick.  The constructor
// throws std::invalid_argument for a non-positive window, range floor or
// midpoint divisor, or a negative padding.
class RollingWindowView
{
   public:
    explicit RollingWindowView(ViewConfig config = {});

    ViewBounds compute(std::span<const Sample> contents, double now) const;
    ViewBounds compute(std::span<const Sample> contents, double window_seconds, double now) const;

    // Picks the right-edge reference according to the configured anchor.
    double resolve_now(std::span<const Sample> contents, double clock_now) const;

    const ViewConfig& config() const { return config_; }

   private:
    ViewConfig config_;
};

// (count - 1) / (t_last - t_first) once count exceeds `min_samples`.
std::optional<double> estimate_rate(std::span<const Sample> contents, std::size_t min_samples);

// "12.3 Hz", or "-- Hz" while the rate is unavailable.
std::string format_rate_label(const std::optional<double>& rate_hz);

}   // namespace pulseplot
