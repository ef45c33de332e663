#include <gtest/gtest.h>
#include <pulseplot/rolling_view.hpp>
#include <stdexcept>
#include <vector>

using namespace pulseplot;

namespace
{

std::vector<Sample> ramp(std::size_t n, double dt, double v0 = 0.0, double dv = 1.0)
{
    std::vector<Sample> out;
    for (std::size_t i = 0; i < n; ++i)
        out.push_back({i * dt, v0 + dv * static_cast<double>(i)});
    return out;
}

}   // namespace

// --- Empty buffer ---

TEST(RollingWindowView, EmptyReturnsInitialBounds)
{
    RollingWindowView view(ViewConfig::serial_preset());
    auto              b = view.compute({}, 42.0);
    EXPECT_DOUBLE_EQ(b.x_min, 0.0);
    EXPECT_DOUBLE_EQ(b.x_max, 10.0);
    EXPECT_DOUBLE_EQ(b.y_min, 0.0);
    EXPECT_DOUBLE_EQ(b.y_max, 100.0);
    EXPECT_FALSE(b.rate_hz.has_value());
    EXPECT_EQ(format_rate_label(b.rate_hz), "-- Hz");
}

TEST(RollingWindowView, CameraPresetInitialRange)
{
    RollingWindowView view(ViewConfig::camera_preset());
    auto              b = view.compute({}, 0.0);
    EXPECT_DOUBLE_EQ(b.y_min, 0.0);
    EXPECT_DOUBLE_EQ(b.y_max, 255.0);
}

// --- X window ---

TEST(RollingWindowView, XWindowEarlyInRunClampsAtZero)
{
    RollingWindowView view(ViewConfig::serial_preset());
    std::vector<Sample> s = {{0.0, 1.0}, {1.0, 2.0}};
    auto                b = view.compute(s, 3.0);
    EXPECT_DOUBLE_EQ(b.x_max, 3.5);
    EXPECT_DOUBLE_EQ(b.x_min, 0.0);
}

TEST(RollingWindowView, XWindowSlides)
{
    RollingWindowView view(ViewConfig::serial_preset());
    std::vector<Sample> s = {{19.0, 1.0}, {20.0, 2.0}};
    auto                b = view.compute(s, 20.0);
    EXPECT_DOUBLE_EQ(b.x_max, 20.5);
    EXPECT_DOUBLE_EQ(b.x_min, 10.5);
}

TEST(RollingWindowView, ExplicitWindowOverridesConfig)
{
    RollingWindowView view(ViewConfig::serial_preset());
    std::vector<Sample> s = {{0.0, 1.0}};
    auto                b = view.compute(s, 5.0, 30.0);
    EXPECT_DOUBLE_EQ(b.x_max, 30.5);
    EXPECT_DOUBLE_EQ(b.x_min, 25.5);
}

TEST(RollingWindowView, ResolveNowFollowsAnchor)
{
    std::vector<Sample> s = {{1.0, 1.0}, {2.5, 2.0}};

    RollingWindowView clock_view(ViewConfig::serial_preset());
    EXPECT_DOUBLE_EQ(clock_view.resolve_now(s, 7.0), 7.0);

    RollingWindowView latest_view(ViewConfig::camera_preset());
    EXPECT_DOUBLE_EQ(latest_view.resolve_now(s, 7.0), 2.5);
    EXPECT_DOUBLE_EQ(latest_view.resolve_now({}, 7.0), 7.0);
}

// --- Y policies ---

TEST(RollingWindowView, MidpointUsesRangeFloor)
{
    RollingWindowView   view(ViewConfig::serial_preset());
    std::vector<Sample> s = {{0.0, 100.0}, {0.1, 100.0}, {0.2, 100.0}, {0.3, 200.0}};
    auto                b = view.compute(s, 0.3);
    // mid 150, range max(50, 100) = 100
    EXPECT_NEAR(b.y_min, 150.0 - 100.0 / 1.8, 1e-9);
    EXPECT_NEAR(b.y_max, 150.0 + 100.0 / 1.8, 1e-9);
}

TEST(RollingWindowView, MidpointFlatSignalGetsFloor)
{
    RollingWindowView   view(ViewConfig::serial_preset());
    std::vector<Sample> s = {{0.0, 512.0}, {0.1, 512.0}};
    auto                b = view.compute(s, 0.1);
    EXPECT_NEAR(b.y_min, 512.0 - 50.0 / 1.8, 1e-9);
    EXPECT_NEAR(b.y_max, 512.0 + 50.0 / 1.8, 1e-9);
    EXPECT_LT(b.y_min, b.y_max);
}

TEST(RollingWindowView, PaddedAddsMargin)
{
    RollingWindowView   view(ViewConfig::camera_preset());
    std::vector<Sample> s = {{0.0, 120.0}, {0.1, 140.0}};
    auto                b = view.compute(s, 0.1);
    EXPECT_DOUBLE_EQ(b.y_min, 110.0);
    EXPECT_DOUBLE_EQ(b.y_max, 150.0);
}

TEST(RollingWindowView, PaddedWidensToFloor)
{
    ViewConfig cfg    = ViewConfig::camera_preset();
    cfg.y_padding     = 1.0;
    cfg.y_range_floor = 20.0;
    RollingWindowView   view(cfg);
    std::vector<Sample> s = {{0.0, 100.0}, {0.1, 102.0}};
    auto                b = view.compute(s, 0.1);
    EXPECT_DOUBLE_EQ(b.y_min, 91.0);
    EXPECT_DOUBLE_EQ(b.y_max, 111.0);
}

TEST(RollingWindowView, RejectsInvalidConfig)
{
    ViewConfig no_divisor       = ViewConfig::serial_preset();
    no_divisor.midpoint_divisor = 0.0;
    EXPECT_THROW(RollingWindowView{no_divisor}, std::invalid_argument);

    ViewConfig no_floor    = ViewConfig::camera_preset();
    no_floor.y_range_floor = 0.0;
    EXPECT_THROW(RollingWindowView{no_floor}, std::invalid_argument);

    ViewConfig no_window     = ViewConfig::serial_preset();
    no_window.window_seconds = -1.0;
    EXPECT_THROW(RollingWindowView{no_window}, std::invalid_argument);

    ViewConfig negative_pad = ViewConfig::camera_preset();
    negative_pad.y_padding  = -1.0;
    EXPECT_THROW(RollingWindowView{negative_pad}, std::invalid_argument);

    // Divisor is ignored by the padded policy
    ViewConfig padded       = ViewConfig::camera_preset();
    padded.midpoint_divisor = 0.0;
    EXPECT_NO_THROW(RollingWindowView{padded});
}

TEST(RollingWindowView, PaddedFlatSignalGetsFloor)
{
    ViewConfig cfg = ViewConfig::camera_preset();
    cfg.y_padding  = 0.0;
    RollingWindowView   view(cfg);
    std::vector<Sample> s = {{0.0, 80.0}, {0.1, 80.0}};
    auto                b = view.compute(s, 0.1);
    EXPECT_DOUBLE_EQ(b.y_min, 75.0);
    EXPECT_DOUBLE_EQ(b.y_max, 85.0);
}

// --- Rate ---

TEST(RollingWindowView, RateFromElevenSamplesOverOneSecond)
{
    RollingWindowView view(ViewConfig::serial_preset());
    auto              s = ramp(11, 0.1);
    auto              b = view.compute(s, 1.0);
    ASSERT_TRUE(b.rate_hz.has_value());
    EXPECT_NEAR(*b.rate_hz, 10.0, 1e-9);
    EXPECT_EQ(format_rate_label(b.rate_hz), "10.0 Hz");
}

TEST(RollingWindowView, RateNeedsMoreThanTenSamples)
{
    EXPECT_FALSE(estimate_rate(ramp(10, 0.1), 10).has_value());
    EXPECT_TRUE(estimate_rate(ramp(11, 0.1), 10).has_value());
}

TEST(RollingWindowView, RateUnavailableForZeroSpan)
{
    std::vector<Sample> s(20, Sample{1.0, 3.0});
    EXPECT_FALSE(estimate_rate(s, 10).has_value());
}

TEST(RollingWindowView, RateLabelFormatting)
{
    EXPECT_EQ(format_rate_label(29.97), "30.0 Hz");
    EXPECT_EQ(format_rate_label(std::nullopt), "-- Hz");
}
