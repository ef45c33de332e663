#include <gtest/gtest.h>
#include <pulseplot/sample_clock.hpp>

using namespace pulseplot;

TEST(SampleClock, FirstStampIsZero)
{
    double      now = 50.0;
    SampleClock clock([&] { return now; });
    EXPECT_FALSE(clock.started());
    EXPECT_DOUBLE_EQ(clock.elapsed(), 0.0);

    now = 51.0;
    EXPECT_DOUBLE_EQ(clock.stamp(), 0.0);
    EXPECT_TRUE(clock.started());

    now = 52.5;
    EXPECT_DOUBLE_EQ(clock.stamp(), 1.5);
    EXPECT_DOUBLE_EQ(clock.elapsed(), 1.5);
}

TEST(SampleClock, ElapsedDoesNotStartClock)
{
    double      now = 3.0;
    SampleClock clock([&] { return now; });
    clock.elapsed();
    now = 10.0;
    EXPECT_DOUBLE_EQ(clock.stamp(), 0.0);
}

TEST(SampleClock, ResetRestartsZeroPoint)
{
    double      now = 0.0;
    SampleClock clock([&] { return now; });
    clock.stamp();
    now = 4.0;
    clock.reset();
    EXPECT_FALSE(clock.started());
    EXPECT_DOUBLE_EQ(clock.stamp(), 0.0);
}

TEST(SampleClock, MonotonicSourceAdvances)
{
    SampleClock clock;
    double      a = clock.stamp();
    double      b = clock.stamp();
    EXPECT_DOUBLE_EQ(a, 0.0);
    EXPECT_GE(b, a);
}
