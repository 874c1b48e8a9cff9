#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <telechart/data/aggregation.hpp>
#include <vector>

using namespace telechart;
using namespace telechart::data;

static Series make_series(const std::vector<double>& values, double dt = 1000.0)
{
    Series s;
    for (std::size_t i = 0; i < values.size(); ++i)
        s.push_back({static_cast<double>(i) * dt, values[i], {}, {}});
    return s;
}

// --- Reducers ---

TEST(Reduce, AllReducers)
{
    std::vector<double> v = {4, 1, 7, std::nan("")};
    EXPECT_DOUBLE_EQ(data::reduce(v, Reducer::Mean), 4.0);
    EXPECT_DOUBLE_EQ(data::reduce(v, Reducer::Sum), 12.0);
    EXPECT_DOUBLE_EQ(data::reduce(v, Reducer::Min), 1.0);
    EXPECT_DOUBLE_EQ(data::reduce(v, Reducer::Max), 7.0);
    EXPECT_DOUBLE_EQ(data::reduce(v, Reducer::Count), 3.0);
}

TEST(Reduce, EmptyIsZero)
{
    EXPECT_DOUBLE_EQ(data::reduce(std::vector<double>{}, Reducer::Mean), 0.0);
}

TEST(Reducer, Names)
{
    EXPECT_EQ(parse_reducer("avg"), Reducer::Mean);
    EXPECT_EQ(parse_reducer("count"), Reducer::Count);
    EXPECT_STREQ(reducer_name(Reducer::Max), "max");
    EXPECT_THROW(parse_reducer("p99"), std::invalid_argument);
}

// --- aggregate_by_window ---

TEST(Aggregate, MeanPerWindowAtMidpoint)
{
    auto out = aggregate_by_window(make_series({1, 2, 3, 4, 5, 6, 7, 8, 9, 10}), 5000.0);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0].time, 2500.0);
    EXPECT_DOUBLE_EQ(out[0].value, 3.0);
    EXPECT_DOUBLE_EQ(out[1].time, 7500.0);
    EXPECT_DOUBLE_EQ(out[1].value, 8.0);
}

TEST(Aggregate, MetadataCountsAndBounds)
{
    auto out = aggregate_by_window(make_series({1, 2, 3, 4, 5, 6, 7}), 5000.0, Reducer::Sum);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(metadata_number(out[0], "count"), 5.0);
    EXPECT_EQ(metadata_number(out[1], "count"), 2.0);
    EXPECT_EQ(metadata_number(out[1], "window_start"), 5000.0);
    EXPECT_EQ(metadata_number(out[1], "window_end"), 10000.0);
    EXPECT_DOUBLE_EQ(out[1].value, 13.0);
}

TEST(Aggregate, EmptyWindowsSkipped)
{
    Series s   = {{0, 1, {}, {}}, {1000, 3, {}, {}}, {20'000, 10, {}, {}}};
    auto   out = aggregate_by_window(s, 5000.0);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0].value, 2.0);
    EXPECT_DOUBLE_EQ(out[1].time, 22'500.0);
}

TEST(Aggregate, CountsSumToInput)
{
    Series s;
    for (int i = 0; i < 997; ++i)
        s.push_back({i * 37.3, static_cast<double>(i), {}, {}});
    auto   out   = aggregate_by_window(s, 1000.0, Reducer::Count);
    double total = 0.0;
    for (std::size_t i = 0; i < out.size(); ++i)
    {
        total += out[i].value;
        if (i > 0)
        {
            EXPECT_LE(*metadata_number(out[i - 1], "window_end"),
                      *metadata_number(out[i], "window_start"));
        }
    }
    EXPECT_DOUBLE_EQ(total, 997.0);
}

TEST(Aggregate, OriginIsFlooredFirstTime)
{
    Series s   = {{1500.7, 1, {}, {}}, {2400, 2, {}, {}}};
    auto   out = aggregate_by_window(s, 1000.0);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(metadata_number(out[0], "window_start"), 1500.0);
}

TEST(Aggregate, MajorityCategoryFirstSeenWinsTie)
{
    Series s   = {{0, 1, "b", {}}, {1, 1, "a", {}}, {2, 1, "a", {}}, {3, 1, "b", {}}};
    auto   out = aggregate_by_window(s, 1000.0);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].category, "b");
}

TEST(Aggregate, InvalidWindowThrows)
{
    auto s = make_series({1, 2});
    EXPECT_THROW((void)aggregate_by_window(s, 0.0), std::invalid_argument);
    EXPECT_THROW((void)aggregate_by_window(s, -5.0), std::invalid_argument);
}

static Series make_epoch_series(std::size_t n, double dt)
{
    Series s;
    for (std::size_t i = 0; i < n; ++i)
        s.push_back({1.7e12 + 0.123 + static_cast<double>(i) * dt, 1.0, {}, {}});
    return s;
}

TEST(Aggregate, SubMillisecondWindowOnEpochTimes)
{
    auto s   = make_epoch_series(1000, 0.37);
    auto out = aggregate_by_window(s, 0.05);
    ASSERT_FALSE(out.empty());

    double total = 0.0;
    for (const auto& w : out)
    {
        const auto count = metadata_number(w, "count");
        ASSERT_TRUE(count.has_value());
        EXPECT_GE(*count, 1.0);
        total += *count;
    }
    EXPECT_DOUBLE_EQ(total, 1000.0);
}

TEST(Aggregate, WindowBelowTimeResolutionThrows)
{
    auto s = make_epoch_series(1000, 0.37);
    EXPECT_THROW((void)aggregate_by_window(s, 1e-6), std::invalid_argument);
    EXPECT_THROW((void)aggregate_by_window(s, 1e-9), std::invalid_argument);
}

TEST(Aggregate, EmptySeries)
{
    EXPECT_TRUE(aggregate_by_window(Series{}, 1000.0).empty());
}

// --- Histogram ---

TEST(BinValues, EqualWidthBins)
{
    std::vector<double> v    = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    auto                bins = bin_values(v, 5);
    ASSERT_EQ(bins.size(), 5u);
    EXPECT_DOUBLE_EQ(bins[0].x0, 0.0);
    EXPECT_DOUBLE_EQ(bins[4].x1, 10.0);
    EXPECT_EQ(bins[0].count, 2u);
    EXPECT_EQ(bins[4].count, 3u);   // 8, 9 and the closed right edge 10
}

TEST(BinValues, ExplicitDomainIgnoresOutside)
{
    std::vector<double> v    = {-5, 1, 2, 50};
    auto                bins = bin_values(v, 2, std::make_pair(0.0, 4.0));
    ASSERT_EQ(bins.size(), 2u);
    EXPECT_EQ(bins[0].count + bins[1].count, 2u);
}

TEST(BinValues, DegenerateExtent)
{
    std::vector<double> v    = {3, 3, 3};
    auto                bins = bin_values(v, 10);
    ASSERT_EQ(bins.size(), 1u);
    EXPECT_EQ(bins[0].count, 3u);
}

// --- Pivot / correlation ---

TEST(Pivot, GroupsAndReduces)
{
    std::vector<PivotRecord> records = {
        {"mon", "rpm", 10}, {"mon", "rpm", 5}, {"tue", "rpm", 7}, {"mon", "speed", 1}};
    auto cells = pivot(records, Reducer::Sum);
    ASSERT_EQ(cells.size(), 3u);
    EXPECT_EQ(cells[0].x, "rpm");
    EXPECT_EQ(cells[0].y, "mon");
    EXPECT_DOUBLE_EQ(cells[0].value, 15.0);
    EXPECT_EQ(cells[2].x, "speed");
}

TEST(CorrelationMatrix, SymmetricWithUnitDiagonal)
{
    std::vector<NamedColumn> cols = {
        {"a", {1, 2, 3, 4}}, {"b", {2, 4, 6, 8}}, {"c", {4, 3, 2, 1}}, {"flat", {1, 1, 1, 1}}};
    auto cells = correlation_matrix(cols);
    ASSERT_EQ(cells.size(), 16u);
    auto at = [&](std::size_t i, std::size_t j) { return cells[i * 4 + j].value; };
    for (std::size_t i = 0; i < 4; ++i)
    {
        EXPECT_DOUBLE_EQ(at(i, i), 1.0);
        for (std::size_t j = 0; j < 4; ++j)
            EXPECT_DOUBLE_EQ(at(i, j), at(j, i));
    }
    EXPECT_NEAR(at(0, 1), 1.0, 1e-12);
    EXPECT_NEAR(at(0, 2), -1.0, 1e-12);
    EXPECT_DOUBLE_EQ(at(0, 3), 0.0);
    EXPECT_EQ(cells[1].x, "a");
    EXPECT_EQ(cells[1].y, "b");
}
