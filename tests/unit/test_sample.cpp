#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <telechart/sample.hpp>

using namespace telechart;

static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

TEST(Sample, Validity)
{
    EXPECT_TRUE(is_valid({1.0, 2.0, {}, {}}));
    EXPECT_FALSE(is_valid({NaN, 2.0, {}, {}}));
    EXPECT_FALSE(is_valid({1.0, std::numeric_limits<double>::infinity(), {}, {}}));
}

TEST(Sample, SanitizeKeepsOrder)
{
    Series s = {{3, 1, {}, {}}, {1, NaN, {}, {}}, {2, 5, {}, {}}};
    auto   out = sanitize(s);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0].time, 3.0);
    EXPECT_DOUBLE_EQ(out[1].time, 2.0);
}

TEST(Sample, PrepareSortsStably)
{
    Series s = {{2, 1, "a", {}}, {1, 2, {}, {}}, {2, 3, "b", {}}};
    auto   out = prepare(s);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_TRUE(is_sorted_by_time(out));
    EXPECT_DOUBLE_EQ(out[0].value, 2.0);
    EXPECT_EQ(out[1].category, "a");
    EXPECT_EQ(out[2].category, "b");
}

TEST(Sample, ValuesOf)
{
    Series s = {{0, 1, {}, {}}, {1, 2, {}, {}}};
    auto   v = values_of(s);
    ASSERT_EQ(v.size(), 2u);
    EXPECT_DOUBLE_EQ(v[1], 2.0);
}

TEST(Sample, MetadataAccessors)
{
    Sample s;
    s.metadata["interpolated"] = true;
    s.metadata["count"]        = 4.0;
    s.metadata["method"]       = std::string("linear");

    EXPECT_EQ(metadata_bool(s, "interpolated"), true);
    EXPECT_EQ(metadata_number(s, "count"), 4.0);
    EXPECT_EQ(metadata_string(s, "method"), "linear");
    EXPECT_FALSE(metadata_number(s, "interpolated").has_value());
    EXPECT_FALSE(metadata_bool(s, "missing").has_value());
}
