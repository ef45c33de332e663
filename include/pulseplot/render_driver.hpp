#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <pulseplot/acquisition.hpp>
#include <pulseplot/display.hpp>
#include <pulseplot/rolling_view.hpp>
#include <pulseplot/sample_buffer.hpp>
#include <pulseplot/sample_clock.hpp>
#include <pulseplot/sample_source.hpp>
#include <string>

namespace pulseplot
{

enum class RunState
{
    Idle,
    Acquiring,   // source opened, timer being armed
    Running,     // ticking
    Closing,     // stop requested or fatal error
    Closed,      // resources released
};

enum class StopReason
{
    None,
    UserRequest,
    SourceUnavailable,
    SourceFailure,
    EndOfStream,
    DisplayFailure,
    TickError,
    DurationElapsed,
};

const char* to_string(RunState state);
const char* to_string(StopReason reason);

// Everything a run needs, owned by the caller and passed in explicitly.
struct RunContext
{
    RunContext(SampleSource& src, SampleClock& clk, std::size_t capacity, ViewConfig view_cfg)
        : source(src), clock(clk), buffer(capacity), view(view_cfg)
    {
    }

    SampleSource&     source;
    SampleClock&      clock;
    SampleBuffer      buffer;
    RollingWindowView view;
};

struct DriverConfig
{
    double      tick_interval_ms = 10.0;
    std::size_t max_per_drain    = AcquisitionLoop::DEFAULT_MAX_PER_DRAIN;
    double      max_run_seconds  = 0.0;   // 0 = until stopped
    bool        paced            = true;  // false: tick back-to-back (tests, replay)
};

// Single-threaded cooperative tick loop: drain, compute view, present.
class RenderDriver
{
   public:
    using StateListener = std::function<void(RunState from, RunState to)>;

    RenderDriver(RunContext& ctx, DisplaySurface& display, DriverConfig config = {});
    ~RenderDriver();

    RenderDriver(const RenderDriver&)            = delete;
    RenderDriver& operator=(const RenderDriver&) = delete;

    // Idle -> Acquiring -> Running.  Returns false (and closes) when the
    // source is not open.
    bool start();

    // One tick.  Returns the update that was presented, or nullopt when the
    // run is no longer Running (the driver is then Closing or Closed).
    std::optional<ViewUpdate> tick();

    // Cooperative stop; observed at the start of the next tick.
    void request_stop() { stop_requested_.store(true, std::memory_order_relaxed); }
    bool stop_requested() const { return stop_requested_.load(std::memory_order_relaxed); }

    // Enter Closing, release the source and display, end in Closed.
    // Safe to call repeatedly; the source is closed exactly once.
    void close();

    // start(), tick at the configured interval until stopped, close().
    // `external_stop` (e.g. set by a signal handler) is polled once per tick.
    StopReason run(const std::atomic<bool>* external_stop = nullptr);

    RunState   state() const { return state_; }
    StopReason stop_reason() const { return stop_reason_; }
    uint64_t   tick_count() const { return tick_count_; }

    const AcquisitionLoop& acquisition() const { return acquisition_; }

    void set_state_listener(StateListener listener) { on_state_ = std::move(listener); }

   private:
    void transition(RunState next);
    void begin_closing(StopReason reason);
    ViewUpdate build_update();

    RunContext&       ctx_;
    DisplaySurface&   display_;
    DriverConfig      config_;
    AcquisitionLoop   acquisition_;
    RunState          state_       = RunState::Idle;
    StopReason        stop_reason_ = StopReason::None;
    std::atomic<bool> stop_requested_{false};
    bool              source_closed_ = false;
    uint64_t          tick_count_    = 0;
    StateListener     on_state_;
};

}   // namespace pulseplot
