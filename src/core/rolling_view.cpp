#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <pulseplot/rolling_view.hpp>

namespace pulseplot
{

ViewConfig ViewConfig::serial_preset()
{
    return ViewConfig{.window_seconds   = 10.0,
                      .right_margin     = 0.5,
                      .y_policy         = YScalePolicy::Midpoint,
                      .y_padding        = 0.0,
                      .y_range_floor    = 50.0,
                      .midpoint_divisor = 1.8,
                      .min_rate_samples = 10,
                      .x_anchor         = XAnchor::Clock,
                      .initial_x        = {0.0, 10.0},
                      .initial_y        = {0.0, 100.0}};
}

ViewConfig ViewConfig::camera_preset()
{
    return ViewConfig{.window_seconds   = 10.0,
                      .right_margin     = 0.1,
                      .y_policy         = YScalePolicy::Padded,
                      .y_padding        = 10.0,
                      .y_range_floor    = 10.0,
                      .midpoint_divisor = 1.8,
                      .min_rate_samples = 10,
                      .x_anchor         = XAnchor::LatestSample,
                      .initial_x        = {0.0, 10.0},
                      .initial_y        = {0.0, 255.0}};
}

RollingWindowView::RollingWindowView(ViewConfig config) : config_(config)
{
    if (!(config_.window_seconds > 0.0))
        throw std::invalid_argument("ViewConfig window_seconds must be positive");
    if (!(config_.y_range_floor > 0.0))
        throw std::invalid_argument("ViewConfig y_range_floor must be positive");
    if (config_.y_policy == YScalePolicy::Midpoint && !(config_.midpoint_divisor > 0.0))
        throw std::invalid_argument("ViewConfig midpoint_divisor must be positive");
    if (config_.y_padding < 0.0)
        throw std::invalid_argument("ViewConfig y_padding must not be negative");
}

static AxisRange value_extent(std::span<const Sample> contents)
{
    double lo = std::numeric_limits<double>::max();
    double hi = -std::numeric_limits<double>::max();
    for (const auto& s : contents)
    {
        lo = std::min(lo, s.value);
        hi = std::max(hi, s.value);
    }
    return {lo, hi};
}

static AxisRange y_bounds(std::span<const Sample> contents, const ViewConfig& cfg)
{
    AxisRange extent = value_extent(contents);

    if (cfg.y_policy == YScalePolicy::Midpoint)
    {
        double mid     = (extent.min + extent.max) * 0.5;
        double range   = std::max(cfg.y_range_floor, extent.max - extent.min);
        return {mid - range / cfg.midpoint_divisor, mid + range / cfg.midpoint_divisor};
    }

    AxisRange padded{extent.min - cfg.y_padding, extent.max + cfg.y_padding};
    double    span = padded.max - padded.min;
    if (span < cfg.y_range_floor)
    {
        double mid  = (extent.min + extent.max) * 0.5;
        double half = cfg.y_range_floor * 0.5;
        padded      = {mid - half, mid + half};
    }
    return padded;
}

ViewBounds RollingWindowView::compute(std::span<const Sample> contents, double now) const
{
    return compute(contents, config_.window_seconds, now);
}

ViewBounds RollingWindowView::compute(std::span<const Sample> contents,
                                      double                  window_seconds,
                                      double                  now) const
{
    ViewBounds bounds;
    if (contents.empty())
    {
        bounds.x_min = config_.initial_x.min;
        bounds.x_max = config_.initial_x.max;
        bounds.y_min = config_.initial_y.min;
        bounds.y_max = config_.initial_y.max;
        return bounds;
    }

    bounds.x_max = now + config_.right_margin;
    bounds.x_min = std::max(0.0, bounds.x_max - window_seconds);

    AxisRange y  = y_bounds(contents, config_);
    bounds.y_min = y.min;
    bounds.y_max = y.max;

    bounds.rate_hz = estimate_rate(contents, config_.min_rate_samples);
    return bounds;
}

double RollingWindowView::resolve_now(std::span<const Sample> contents, double clock_now) const
{
    if (config_.x_anchor == XAnchor::LatestSample && !contents.empty())
        return contents.back().timestamp;
    return clock_now;
}

std::optional<double> estimate_rate(std::span<const Sample> contents, std::size_t min_samples)
{
    if (contents.size() <= min_samples || contents.size() < 2)
        return std::nullopt;

    double span = contents.back().timestamp - contents.front().timestamp;
    if (!(span > 0.0))
        return std::nullopt;

    return static_cast<double>(contents.size() - 1) / span;
}

std::string format_rate_label(const std::optional<double>& rate_hz)
{
    if (!rate_hz)
        return "-- Hz";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f Hz", *rate_hz);
    return buf;
}

}   // namespace pulseplot
