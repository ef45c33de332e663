#include <atomic>
#include <gtest/gtest.h>
#include <pulseplot/render_driver.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

#include "../util/recording_display.hpp"
#include "../util/scripted_source.hpp"

using namespace pulseplot;
using pulseplot::test::RecordingDisplay;
using pulseplot::test::ScriptedSource;

namespace
{

struct DriverFixture : public ::testing::Test
{
    double           now = 0.0;
    SampleClock      clock{[this] { return now; }};
    ScriptedSource   source{"scripted"};
    RecordingDisplay display;

    DriverConfig unpaced(double max_seconds = 0.0)
    {
        DriverConfig c;
        c.paced           = false;
        c.max_run_seconds = max_seconds;
        return c;
    }
};

}   // namespace

// --- State machine ---

TEST_F(DriverFixture, StartsIdleAndRuns)
{
    std::vector<std::pair<RunState, RunState>> seen;

    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());
    driver.set_state_listener([&](RunState a, RunState b) { seen.emplace_back(a, b); });

    EXPECT_EQ(driver.state(), RunState::Idle);
    ASSERT_TRUE(driver.start());
    EXPECT_EQ(driver.state(), RunState::Running);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].second, RunState::Acquiring);
    EXPECT_EQ(seen[1].second, RunState::Running);
}

TEST_F(DriverFixture, UnavailableSourceClosesImmediately)
{
    source.set_open(false);
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());

    EXPECT_FALSE(driver.start());
    EXPECT_EQ(driver.state(), RunState::Closed);
    EXPECT_EQ(driver.stop_reason(), StopReason::SourceUnavailable);
    EXPECT_TRUE(display.frames().empty());
    EXPECT_EQ(source.close_calls(), 1);
}

TEST_F(DriverFixture, TickPresentsBufferedData)
{
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());
    ASSERT_TRUE(driver.start());

    source.push_sample(0.0, 100.0);
    source.push_sample(0.5, 200.0);
    now = 1.0;

    auto update = driver.tick();
    ASSERT_TRUE(update.has_value());
    ASSERT_EQ(display.frames().size(), 1u);

    const auto& f = display.frames()[0];
    ASSERT_EQ(f.x.size(), 2u);
    EXPECT_DOUBLE_EQ(f.y[1], 200.0);
    EXPECT_DOUBLE_EQ(f.bounds.x_max, 1.5);
    EXPECT_DOUBLE_EQ(f.bounds.x_min, 0.0);
    EXPECT_EQ(f.rate_label, "-- Hz");
    ASSERT_TRUE(f.latest_value.has_value());
    EXPECT_DOUBLE_EQ(*f.latest_value, 200.0);
}

TEST_F(DriverFixture, EmptyTickShowsDefaults)
{
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());
    ASSERT_TRUE(driver.start());

    ASSERT_TRUE(driver.tick().has_value());
    const auto& f = display.frames().back();
    EXPECT_TRUE(f.x.empty());
    EXPECT_DOUBLE_EQ(f.bounds.x_max, 10.0);
    EXPECT_DOUBLE_EQ(f.bounds.y_max, 100.0);
    EXPECT_FALSE(f.latest_value.has_value());
}

TEST_F(DriverFixture, StatusTextForwarded)
{
    source.set_status("FPS: 30.0");
    RunContext   ctx(source, clock, 100, ViewConfig::camera_preset());
    RenderDriver driver(ctx, display, unpaced());
    ASSERT_TRUE(driver.start());
    driver.tick();
    EXPECT_EQ(display.frames().back().status, "FPS: 30.0");
}

// --- Stopping ---

TEST_F(DriverFixture, StopDuringTickClosesSourceOnce)
{
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());

    source.set_endless([this]() -> ReadResult { return Sample{now, 1.0}; });
    display.set_on_present(
        [&](const ViewUpdate& u)
        {
            if (u.tick == 3)
                driver.request_stop();
            return true;
        });

    auto reason = driver.run();
    EXPECT_EQ(reason, StopReason::UserRequest);
    EXPECT_EQ(driver.state(), RunState::Closed);
    EXPECT_EQ(source.close_calls(), 1);
    EXPECT_EQ(display.close_calls(), 1);
    EXPECT_EQ(display.frames().size(), 3u);

    // Explicit close and destruction do not close again
    driver.close();
    EXPECT_EQ(source.close_calls(), 1);
}

TEST_F(DriverFixture, TickAfterStopDoesNothing)
{
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());
    ASSERT_TRUE(driver.start());

    driver.request_stop();
    EXPECT_FALSE(driver.tick().has_value());
    EXPECT_EQ(driver.state(), RunState::Closing);
    EXPECT_FALSE(driver.tick().has_value());
    EXPECT_TRUE(display.frames().empty());

    driver.close();
    EXPECT_EQ(driver.state(), RunState::Closed);
    EXPECT_EQ(source.close_calls(), 1);
}

TEST_F(DriverFixture, DisplayCloseStopsRun)
{
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());
    display.set_on_present(
        [&](const ViewUpdate&)
        {
            display.request_close();
            return true;
        });

    EXPECT_EQ(driver.run(), StopReason::UserRequest);
    EXPECT_EQ(display.frames().size(), 1u);
    EXPECT_EQ(source.close_calls(), 1);
}

TEST_F(DriverFixture, ExternalStopFlag)
{
    RunContext        ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver      driver(ctx, display, unpaced());
    std::atomic<bool> stop{false};
    display.set_on_present(
        [&](const ViewUpdate& u)
        {
            if (u.tick == 2)
                stop = true;
            return true;
        });

    EXPECT_EQ(driver.run(&stop), StopReason::UserRequest);
    EXPECT_EQ(display.frames().size(), 2u);
}

// --- Failures ---

TEST_F(DriverFixture, SourceFailureEndsRun)
{
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());
    source.push_sample(0.0, 1.0);
    source.push_failure("device disconnected");

    EXPECT_EQ(driver.run(), StopReason::SourceFailure);
    EXPECT_EQ(driver.state(), RunState::Closed);
    EXPECT_EQ(source.close_calls(), 1);
    EXPECT_TRUE(display.frames().empty());
    EXPECT_EQ(ctx.buffer.size(), 1u);
}

TEST_F(DriverFixture, EndOfStreamIsOrderly)
{
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());
    source.push_failure("end of stream", true);

    EXPECT_EQ(driver.run(), StopReason::EndOfStream);
}

TEST_F(DriverFixture, DisplayFailureEndsRun)
{
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());
    display.set_on_present([](const ViewUpdate&) { return false; });

    EXPECT_EQ(driver.run(), StopReason::DisplayFailure);
    EXPECT_EQ(source.close_calls(), 1);
}

TEST_F(DriverFixture, ThrowingDisplayStillClosesSource)
{
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());
    display.set_on_present([](const ViewUpdate&) -> bool { throw std::runtime_error("boom"); });

    EXPECT_EQ(driver.run(), StopReason::TickError);
    EXPECT_EQ(driver.state(), RunState::Closed);
    EXPECT_EQ(source.close_calls(), 1);
}

TEST_F(DriverFixture, MalformedInputDoesNotStopRun)
{
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());
    ASSERT_TRUE(driver.start());

    source.push_sample(0.0, 12.0);
    source.push_decode_error("oops");
    source.push_sample(0.1, 34.0);
    ASSERT_TRUE(driver.tick().has_value());

    EXPECT_EQ(driver.state(), RunState::Running);
    EXPECT_EQ(ctx.buffer.size(), 2u);
    EXPECT_EQ(driver.acquisition().total_skipped(), 1u);
}

TEST_F(DriverFixture, DurationLimit)
{
    RunContext   ctx(source, clock, 100, ViewConfig::serial_preset());
    DriverConfig cfg;
    cfg.tick_interval_ms = 1.0;
    cfg.max_run_seconds  = 0.05;
    RenderDriver driver(ctx, display, cfg);

    EXPECT_EQ(driver.run(), StopReason::DurationElapsed);
    EXPECT_EQ(source.close_calls(), 1);
    EXPECT_FALSE(display.frames().empty());
}

TEST_F(DriverFixture, BufferBoundedOverLongRun)
{
    RunContext   ctx(source, clock, 50, ViewConfig::serial_preset());
    RenderDriver driver(ctx, display, unpaced());
    ASSERT_TRUE(driver.start());

    double t = 0.0;
    for (int i = 0; i < 40; ++i)
    {
        for (int k = 0; k < 10; ++k)
        {
            source.push_sample(t, k);
            t += 0.01;
        }
        now = t;
        ASSERT_TRUE(driver.tick().has_value());
        EXPECT_LE(display.frames().back().x.size(), 50u);
    }
    EXPECT_EQ(ctx.buffer.size(), 50u);
    EXPECT_EQ(driver.acquisition().total_ingested(), 400u);
}

TEST(RenderDriverNames, StopReasonStrings)
{
    EXPECT_STREQ(to_string(RunState::Running), "Running");
    EXPECT_STREQ(to_string(StopReason::EndOfStream), "end of stream");
}
