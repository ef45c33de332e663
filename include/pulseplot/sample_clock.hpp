#pragma once

#include <functional>
#include <optional>

namespace pulseplot
{

// Run-relative time base.  The zero point is fixed by the first stamp()
// call, i.e. the first successful read from the source.
class SampleClock
{
   public:
    using TimeSource = std::function<double()>;   // monotonic seconds, arbitrary epoch

    SampleClock();
    explicit SampleClock(TimeSource source);

    // Seconds since the zero point; fixes the zero point on first use.
    double stamp();

    // Seconds since the zero point, or 0 before the first stamp().
    double elapsed() const;

    bool started() const { return origin_.has_value(); }
    void reset() { origin_.reset(); }

    static double monotonic_seconds();

   private:
    TimeSource            source_;
    std::optional<double> origin_;
};

}   // namespace pulseplot
