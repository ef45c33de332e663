#pragma once

#include <cstdint>
#include <optional>
#include <pulseplot/rolling_view.hpp>
#include <span>
#include <string>

namespace pulseplot
{

// Per-tick snapshot handed to the display.  The spans point into the
// driver's buffer and are only valid for the duration of present().
struct ViewUpdate
{
    std::span<const double> x;
    std::span<const double> y;
    ViewBounds              bounds;
    std::string             rate_label;
    std::optional<double>   latest_value;
    std::string             status;   // source status text, may be empty
    uint64_t                tick = 0;
};

// Rendering target driven once per tick.
class DisplaySurface
{
   public:
    virtual ~DisplaySurface() = default;

    // Draws one update.  Returns false on an unrecoverable surface error.
    virtual bool present(const ViewUpdate& update) = 0;

    // User asked to stop (window closed, quit key).
    virtual bool should_close() const = 0;

    // Releases windowing resources.  Idempotent.
    virtual void close() {}
};

}   // namespace pulseplot
