#include "tick_scheduler.hpp"

#include <exception>
#include <pulseplot/logger.hpp>
#include <pulseplot/render_driver.hpp>

namespace pulseplot
{

const char* to_string(RunState state)
{
    switch (state)
    {
        case RunState::Idle:
            return "Idle";
        case RunState::Acquiring:
            return "Acquiring";
        case RunState::Running:
            return "Running";
        case RunState::Closing:
            return "Closing";
        case RunState::Closed:
            return "Closed";
    }
    return "Unknown";
}

const char* to_string(StopReason reason)
{
    switch (reason)
    {
        case StopReason::None:
            return "none";
        case StopReason::UserRequest:
            return "stop requested";
        case StopReason::SourceUnavailable:
            return "acquisition source unavailable";
        case StopReason::SourceFailure:
            return "source read failure";
        case StopReason::EndOfStream:
            return "end of stream";
        case StopReason::DisplayFailure:
            return "display failure";
        case StopReason::TickError:
            return "error during tick";
        case StopReason::DurationElapsed:
            return "run duration elapsed";
    }
    return "unknown";
}

RenderDriver::RenderDriver(RunContext& ctx, DisplaySurface& display, DriverConfig config)
    : ctx_(ctx), display_(display), config_(config), acquisition_(ctx.buffer, config.max_per_drain)
{
}

RenderDriver::~RenderDriver()
{
    close();
}

void RenderDriver::transition(RunState next)
{
    if (next == state_)
        return;
    RunState prev = state_;
    state_        = next;
    PULSEPLOT_LOG_INFO("driver", "{} -> {}", to_string(prev), to_string(next));
    if (on_state_)
        on_state_(prev, next);
}

void RenderDriver::begin_closing(StopReason reason)
{
    if (state_ == RunState::Closing || state_ == RunState::Closed)
        return;
    if (stop_reason_ == StopReason::None)
        stop_reason_ = reason;
    transition(RunState::Closing);
}

bool RenderDriver::start()
{
    if (state_ != RunState::Idle)
        return state_ == RunState::Running;

    transition(RunState::Acquiring);
    if (!ctx_.source.is_open())
    {
        PULSEPLOT_LOG_ERROR("driver", "{} is not open", ctx_.source.describe());
        begin_closing(StopReason::SourceUnavailable);
        close();
        return false;
    }

    PULSEPLOT_LOG_INFO("driver",
                       "Acquiring from {} every {}ms (buffer {} samples, window {}s)",
                       ctx_.source.describe(),
                       config_.tick_interval_ms,
                       ctx_.buffer.capacity(),
                       ctx_.view.config().window_seconds);
    transition(RunState::Running);
    return true;
}

ViewUpdate RenderDriver::build_update()
{
    auto       contents = ctx_.buffer.contents();
    double     now      = ctx_.view.resolve_now(contents, ctx_.clock.elapsed());
    ViewUpdate update;
    update.x          = ctx_.buffer.times();
    update.y          = ctx_.buffer.values();
    update.bounds     = ctx_.view.compute(contents, now);
    update.rate_label = format_rate_label(update.bounds.rate_hz);
    if (!contents.empty())
        update.latest_value = contents.back().value;
    update.status = ctx_.source.status_text();
    update.tick   = tick_count_;
    return update;
}

std::optional<ViewUpdate> RenderDriver::tick()
{
    if (state_ != RunState::Running)
        return std::nullopt;

    if (stop_requested())
    {
        begin_closing(StopReason::UserRequest);
        return std::nullopt;
    }

    try
    {
        ++tick_count_;

        DrainResult drained = acquisition_.drain(ctx_.source);
        if (drained.source_failed)
        {
            begin_closing(drained.end_of_stream ? StopReason::EndOfStream
                                                : StopReason::SourceFailure);
            return std::nullopt;
        }

        ViewUpdate update = build_update();
        if (!display_.present(update))
        {
            PULSEPLOT_LOG_ERROR("driver", "Display failed to present tick {}", tick_count_);
            begin_closing(StopReason::DisplayFailure);
            return std::nullopt;
        }

        if (display_.should_close())
            request_stop();

        return update;
    }
    catch (const std::exception& e)
    {
        PULSEPLOT_LOG_ERROR("driver", "Tick {} failed: {}", tick_count_, e.what());
        begin_closing(StopReason::TickError);
        return std::nullopt;
    }
}

void RenderDriver::close()
{
    if (state_ == RunState::Closed)
        return;

    begin_closing(StopReason::UserRequest);

    if (!source_closed_)
    {
        source_closed_ = true;
        try
        {
            ctx_.source.close();
        }
        catch (const std::exception& e)
        {
            PULSEPLOT_LOG_ERROR("driver", "Closing {} failed: {}", ctx_.source.describe(), e.what());
        }
    }

    try
    {
        display_.close();
    }
    catch (const std::exception& e)
    {
        PULSEPLOT_LOG_ERROR("driver", "Closing display failed: {}", e.what());
    }

    transition(RunState::Closed);
    PULSEPLOT_LOG_INFO("driver",
                       "Run ended ({}) after {} ticks, {} samples ingested, {} skipped",
                       to_string(stop_reason_),
                       tick_count_,
                       acquisition_.total_ingested(),
                       acquisition_.total_skipped());
}

StopReason RenderDriver::run(const std::atomic<bool>* external_stop)
{
    if (!start())
        return stop_reason_;

    TickScheduler scheduler(config_.tick_interval_ms,
                            config_.paced ? TickScheduler::Mode::FixedInterval
                                          : TickScheduler::Mode::Uncapped);

    try
    {
        while (state_ == RunState::Running)
        {
            scheduler.begin_tick();

            if (external_stop && external_stop->load(std::memory_order_relaxed))
                request_stop();

            if (config_.max_run_seconds > 0.0
                && scheduler.elapsed_seconds() >= config_.max_run_seconds)
            {
                begin_closing(StopReason::DurationElapsed);
                break;
            }

            tick();
            scheduler.end_tick();
        }
    }
    catch (const std::exception& e)
    {
        PULSEPLOT_LOG_ERROR("driver", "Render loop failed: {}", e.what());
        begin_closing(StopReason::TickError);
    }

    close();
    return stop_reason_;
}

}   // namespace pulseplot
