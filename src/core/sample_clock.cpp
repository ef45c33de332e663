#include <chrono>
#include <pulseplot/sample_clock.hpp>

namespace pulseplot
{

SampleClock::SampleClock() : source_(&SampleClock::monotonic_seconds) {}

SampleClock::SampleClock(TimeSource source) : source_(std::move(source))
{
    if (!source_)
        source_ = &SampleClock::monotonic_seconds;
}

double SampleClock::stamp()
{
    double now = source_();
    if (!origin_)
    {
        origin_ = now;
        return 0.0;
    }
    return now - *origin_;
}

double SampleClock::elapsed() const
{
    if (!origin_)
        return 0.0;
    return source_() - *origin_;
}

double SampleClock::monotonic_seconds()
{
    using Duration = std::chrono::duration<double>;
    return std::chrono::duration_cast<Duration>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

}   // namespace pulseplot
