#include <cmath>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

#include "math/ticks.hpp"

using namespace telechart;

// --- Numeric ticks ---

static std::vector<std::string> labels_of(double dmin, double dmax, int target)
{
    return generate_ticks(dmin, dmax, target).labels;
}

TEST(NumericTicks, PercentAxis)
{
    auto ticks = generate_ticks(0.0, 100.0, 5);
    EXPECT_EQ(ticks.labels, (std::vector<std::string>{"0", "20", "40", "60", "80", "100"}));
    ASSERT_EQ(ticks.positions.size(), 6u);
    EXPECT_DOUBLE_EQ(ticks.positions.back(), 100.0);
}

TEST(NumericTicks, StaysInsideRange)
{
    auto ticks = generate_ticks(-40.0, -10.0, 7);
    EXPECT_EQ(ticks.labels, (std::vector<std::string>{"-40", "-30", "-20", "-10"}));
    for (double v : ticks.positions)
    {
        EXPECT_GE(v, -40.0);
        EXPECT_LE(v, -10.0);
    }
}

TEST(NumericTicks, ZeroIsExact)
{
    auto ticks = generate_ticks(-5.0, 5.0, 7);
    ASSERT_EQ(ticks.positions.size(), 5u);
    EXPECT_EQ(ticks.positions[2], 0.0);
    EXPECT_FALSE(std::signbit(ticks.positions[2]));
}

TEST(NumericTicks, SignedZeroNeverPrinted)
{
    EXPECT_EQ(labels_of(-1.0, 1.0, 7),
              (std::vector<std::string>{"-1.0", "-0.5", "0", "0.5", "1.0"}));
}

TEST(NumericTicks, ReversedBoundsMatch)
{
    EXPECT_EQ(generate_ticks(250.0, 0.0).positions, generate_ticks(0.0, 250.0).positions);
}

TEST(NumericTicks, FlatSeriesIsPadded)
{
    EXPECT_EQ(labels_of(5.0, 5.0, 7),
              (std::vector<std::string>{"4.6", "4.8", "5.0", "5.2", "5.4"}));

    auto zero = generate_ticks(0.0, 0.0);
    ASSERT_EQ(zero.positions.size(), 1u);
    EXPECT_EQ(zero.labels[0], "0");
}

TEST(NumericTicks, SubUlpRangeGivesMidpoint)
{
    auto ticks = generate_ticks(1.0, 1.0 + 1e-15);
    ASSERT_EQ(ticks.positions.size(), 1u);
    EXPECT_EQ(ticks.labels.size(), 1u);
    EXPECT_GT(ticks.positions[0], 1.0);
}

TEST(NumericTicks, NarrowWindowLabelsAreDistinct)
{
    auto                  labels = labels_of(7.89999, 7.90001, 7);
    std::set<std::string> unique(labels.begin(), labels.end());
    EXPECT_GE(labels.size(), 3u);
    EXPECT_EQ(unique.size(), labels.size());
}

TEST(NumericTicks, ByteCountersUseScientific)
{
    auto labels = labels_of(0.0, 4e9, 5);
    ASSERT_EQ(labels.size(), 5u);
    EXPECT_EQ(labels[0], "0");
    EXPECT_EQ(labels[1], "1.00e+09");
}

// --- Spacing / extent ---

TEST(NiceSpacing, OneTwoFive)
{
    EXPECT_DOUBLE_EQ(nice_tick_spacing(0.0, 100.0, 10), 10.0);
    EXPECT_DOUBLE_EQ(nice_tick_spacing(0.0, 1.0, 5), 0.2);
    EXPECT_DOUBLE_EQ(nice_tick_spacing(1.0, 1.0, 5), 0.0);
    EXPECT_DOUBLE_EQ(nice_tick_spacing(0.0, INFINITY, 5), 0.0);
}

TEST(NiceExtent, ContainsInput)
{
    auto [lo, hi] = nice_extent(0.3, 9.7, 10);
    EXPECT_DOUBLE_EQ(lo, 0.0);
    EXPECT_DOUBLE_EQ(hi, 10.0);

    auto [lo2, hi2] = nice_extent(-13.7, 241.2, 5);
    EXPECT_LE(lo2, -13.7);
    EXPECT_GE(hi2, 241.2);
}

TEST(FormatTick, DigitsFollowSpacing)
{
    EXPECT_EQ(format_tick_value(50.0, 10.0), "50");
    EXPECT_EQ(format_tick_value(0.5, 0.1), "0.5");
    EXPECT_EQ(format_tick_value(0.25, 0.05), "0.25");
    EXPECT_EQ(format_tick_value(1e-9, 1.0), "0");
}

// --- Time ticks ---

TEST(TimeTicks, IntervalLadder)
{
    EXPECT_DOUBLE_EQ(time_tick_interval(0.0, 5'000.0, 10), 1'000.0);
    EXPECT_DOUBLE_EQ(time_tick_interval(0.0, 60'000.0, 10), 15'000.0);
    EXPECT_DOUBLE_EQ(time_tick_interval(0.0, 3'600'000.0, 10), 15.0 * 60'000.0);
    EXPECT_DOUBLE_EQ(time_tick_interval(0.0, 86'400'000.0, 8), 3.0 * 3'600'000.0);
}

TEST(TimeTicks, BeyondOneYearUsesWholeYears)
{
    const double year = 365.0 * 86'400'000.0;
    EXPECT_DOUBLE_EQ(time_tick_interval(0.0, 30.0 * year, 10), 3.0 * year);
}

TEST(TimeTicks, LabelsByInterval)
{
    const double t = 1'704'067'200'000.0 + 3'723'000.0;   // 2024-01-01 01:02:03 UTC
    EXPECT_EQ(format_time_tick(t, 1'000.0), "01:02:03");
    EXPECT_EQ(format_time_tick(t, 60'000.0), "01:02");
    EXPECT_EQ(format_time_tick(t, 86'400'000.0), "2024-01-01");
}

TEST(TimeTicks, AlignedToInterval)
{
    const double start = 1'704'067'200'000.0 + 7'000.0;
    auto         ticks = generate_time_ticks(start, start + 60'000.0, 10);
    ASSERT_FALSE(ticks.positions.empty());
    EXPECT_EQ(ticks.positions.size(), ticks.labels.size());
    for (double v : ticks.positions)
    {
        EXPECT_EQ(std::fmod(v, 15'000.0), 0.0);
        EXPECT_GE(v, start);
        EXPECT_LE(v, start + 60'000.0);
    }
}

TEST(TimeTicks, SubSecondFallsBackToNumeric)
{
    auto ticks = generate_time_ticks(0.0, 500.0, 5);
    ASSERT_GE(ticks.positions.size(), 2u);
    EXPECT_EQ(ticks.labels[0], "0");
}

TEST(TimeTicks, NiceExtent)
{
    auto [lo, hi] = nice_time_extent(7'000.0, 58'000.0, 10);
    EXPECT_DOUBLE_EQ(lo, 0.0);
    EXPECT_DOUBLE_EQ(hi, 60'000.0);
}
