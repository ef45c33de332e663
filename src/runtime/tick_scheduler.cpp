#include "tick_scheduler.hpp"

#include <pulseplot/logger.hpp>
#include <thread>

namespace pulseplot
{

TickScheduler::TickScheduler(double interval_ms, Mode mode) : interval_ms_(interval_ms), mode_(mode)
{
    reset();
}

void TickScheduler::set_interval_ms(double ms)
{
    if (ms > 0.0)
        interval_ms_ = ms;
}

void TickScheduler::begin_tick()
{
    tick_start_ = Clock::now();

    if (first_tick_)
    {
        first_tick_      = false;
        start_time_      = tick_start_;
        last_tick_start_ = tick_start_;
        tick_            = TickInfo{};
        return;
    }

    Duration since_start = tick_start_ - start_time_;
    Duration dt          = tick_start_ - last_tick_start_;
    last_tick_start_     = tick_start_;

    tick_.dt          = dt.count();
    tick_.elapsed_sec = since_start.count();
    tick_.number++;

    update_stats(tick_.dt * 1000.0);
}

void TickScheduler::end_tick()
{
    if (mode_ != Mode::FixedInterval || interval_ms_ <= 0.0)
        return;

    Duration target{interval_ms_ / 1000.0};
    Duration spent = Clock::now() - tick_start_;
    if (spent >= target)
        return;

    // Sleep for most of the remaining time, spin the last millisecond
    Duration remaining = target - spent;
    auto     sleep_for = remaining - Duration{0.001};
    if (sleep_for.count() > 0.0)
        std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::microseconds>(sleep_for));

    auto deadline = tick_start_ + std::chrono::duration_cast<Clock::duration>(target);
    while (Clock::now() < deadline)
    {
        std::this_thread::yield();
    }
}

void TickScheduler::reset()
{
    first_tick_         = true;
    tick_               = TickInfo{};
    stats_              = TickStats{};
    max_in_window_      = 0.0;
    sum_in_window_      = 0.0;
    overruns_in_window_ = 0;
    window_counter_     = 0;
}

void TickScheduler::update_stats(double dt_ms)
{
    if (dt_ms > max_in_window_)
        max_in_window_ = dt_ms;
    sum_in_window_ += dt_ms;
    window_counter_++;

    if (dt_ms > interval_ms_ * 2.0)
    {
        overruns_in_window_++;
        PULSEPLOT_LOG_DEBUG("scheduler",
                            "Tick {} overran: {}ms (interval: {}ms)",
                            tick_.number,
                            dt_ms,
                            interval_ms_);
    }

    if (window_counter_ >= STATS_WINDOW_TICKS)
    {
        stats_.max_tick_ms       = max_in_window_;
        stats_.avg_tick_ms       = sum_in_window_ / static_cast<double>(window_counter_);
        stats_.overrun_count     = overruns_in_window_;
        stats_.window_tick_count = window_counter_;

        if (overruns_in_window_ > 0)
        {
            PULSEPLOT_LOG_INFO("scheduler",
                               "Tick stats ({} ticks): avg={}ms max={}ms overruns={}",
                               window_counter_,
                               stats_.avg_tick_ms,
                               stats_.max_tick_ms,
                               overruns_in_window_);
        }

        max_in_window_      = 0.0;
        sum_in_window_      = 0.0;
        overruns_in_window_ = 0;
        window_counter_     = 0;
    }
}

}   // namespace pulseplot
