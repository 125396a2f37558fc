#include <gtest/gtest.h>

#include "util/Metrics.hpp"
#include "fakes.hpp"

TEST(Metrics, EmptyIsZero) {
    Metrics m;
    EXPECT_EQ(m.getCount(), 0);
    EXPECT_EQ(m.getMin(), 0u);
    EXPECT_EQ(m.getMax(), 0u);
    EXPECT_EQ(m.getAverage(), 0u);
}

TEST(Metrics, PartialWindowOnlyCountsRecorded) {
    Metrics m;
    m.record(10);
    m.record(30);
    EXPECT_EQ(m.getCount(), 2);
    EXPECT_EQ(m.getMin(), 10u);
    EXPECT_EQ(m.getMax(), 30u);
    EXPECT_EQ(m.getAverage(), 20u);
}

TEST(Metrics, WindowRollsOver) {
    Metrics m;
    for (int i = 0; i < Metrics::WINDOW; i++) m.record(1000);
    for (int i = 0; i < Metrics::WINDOW; i++) m.record(5);
    EXPECT_EQ(m.getCount(), Metrics::WINDOW);
    EXPECT_EQ(m.getMax(), 5u);
    EXPECT_EQ(m.getAverage(), 5u);
}

TEST(Metrics, MeasureUsesTheGivenClock) {
    FakeClock clock;
    Metrics m;
    MEASURE(clock, m, clock.advance(1234));
    EXPECT_EQ(m.getCount(), 1);
    EXPECT_EQ(m.getMax(), 1234u);
}
