#pragma once

#include <chrono>
#include <cstdint>

namespace pulseplot
{

struct TickInfo
{
    double   elapsed_sec = 0.0;
    double   dt          = 0.0;
    uint64_t number      = 0;
};

// Paces the render loop at a fixed wall-clock interval, independent of how
// often samples arrive.
class TickScheduler
{
   public:
    enum class Mode
    {
        FixedInterval,   // sleep + short spin to hit the interval
        Uncapped,        // no waiting
    };

    explicit TickScheduler(double interval_ms = 10.0, Mode mode = Mode::FixedInterval);

    void   set_interval_ms(double ms);
    double interval_ms() const { return interval_ms_; }

    // Call at the start and end of each tick
    void begin_tick();
    void end_tick();

    void reset();

    const TickInfo& current() const { return tick_; }
    double          elapsed_seconds() const { return tick_.elapsed_sec; }

    // Overrun tracking over a rolling window of ticks
    struct TickStats
    {
        double   max_tick_ms        = 0.0;
        double   avg_tick_ms        = 0.0;
        uint32_t overrun_count      = 0;   // ticks longer than 2x the interval
        uint64_t window_tick_count  = 0;
    };
    TickStats stats() const { return stats_; }

   private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::duration<double>;

    static constexpr uint64_t STATS_WINDOW_TICKS = 1000;   // ~10s at 100 Hz

    void update_stats(double dt_ms);

    double interval_ms_ = 10.0;
    Mode   mode_        = Mode::FixedInterval;

    TimePoint start_time_;
    TimePoint tick_start_;
    TimePoint last_tick_start_;
    bool      first_tick_ = true;

    TickInfo  tick_;
    TickStats stats_;
    double    max_in_window_      = 0.0;
    double    sum_in_window_      = 0.0;
    uint32_t  overruns_in_window_ = 0;
    uint64_t  window_counter_     = 0;
};

}   // namespace pulseplot
