#include <gtest/gtest.h>
#include "sweep/ParameterRange.h"
#include <limits>

using namespace Sweep;

TEST(ParameterRangeTest, ParsesSingleValues)
{
    auto r = ParameterRange::parse("8");
    ASSERT_TRUE(r.isSuccess());
    EXPECT_EQ(r.value(), ParameterRange::single(8));
    EXPECT_EQ(r.value().count(), 1);

    r = ParameterRange::parse(" 3 ");
    ASSERT_TRUE(r.isSuccess());
    EXPECT_EQ(r.value(), ParameterRange::single(3));

    r = ParameterRange::parse("-3");
    ASSERT_TRUE(r.isSuccess());
    EXPECT_EQ(r.value(), ParameterRange::single(-3));
}

TEST(ParameterRangeTest, ParsesRanges)
{
    auto r = ParameterRange::parse("0-10");
    ASSERT_TRUE(r.isSuccess());
    EXPECT_EQ(r.value(), ParameterRange::span(0, 10));
    EXPECT_EQ(r.value().count(), 11);

    r = ParameterRange::parse("-5 - 5");
    ASSERT_TRUE(r.isSuccess());
    EXPECT_EQ(r.value(), ParameterRange::span(-5, 5));

    r = ParameterRange::parse("-5--3");
    ASSERT_TRUE(r.isSuccess());
    EXPECT_EQ(r.value(), ParameterRange::span(-5, -3));
}

TEST(ParameterRangeTest, RejectsMalformedText)
{
    for (const char* text : {"abc", "1-", "5-2", "1-2-3", "", "   ", "1.5", "0x10"}) {
        const auto r = ParameterRange::parse(text);
        EXPECT_TRUE(r.isError()) << "accepted '" << text << "'";
        if (r.isError()) EXPECT_FALSE(r.error().isEmpty());
    }
}

TEST(ParameterRangeTest, InvertedSpanIsEmpty)
{
    const ParameterRange r = ParameterRange::span(3, 1);
    EXPECT_TRUE(r.isEmpty());
    EXPECT_EQ(r.count(), 0);
}

TEST(SearchRangesTest, EnumeratesInKAThenBOrder)
{
    SearchRanges s;
    s.iterations = ParameterRange::span(0, 1);
    s.a = ParameterRange::span(-1, 0);
    s.b = ParameterRange::span(5, 6);
    ASSERT_EQ(s.combinationCount(), 8);

    const auto all = s.enumerate();
    ASSERT_EQ(all.size(), 8);
    EXPECT_EQ(all.front().fileName(), "0_-1_5.png");
    EXPECT_EQ(all[1].fileName(), "0_-1_6.png");
    EXPECT_EQ(all[2].fileName(), "0_0_5.png");
    EXPECT_EQ(all.back().fileName(), "1_0_6.png");
}

TEST(SearchRangesTest, EmptyWhenAnyRangeIsEmpty)
{
    SearchRanges s;
    s.iterations = ParameterRange::span(0, 5);
    s.a = ParameterRange::span(2, 1);
    s.b = ParameterRange::single(1);
    EXPECT_EQ(s.combinationCount(), 0);
    EXPECT_TRUE(s.enumerate().isEmpty());
}

TEST(SearchRangesTest, RejectsNegativeIterations)
{
    SearchRanges s;
    s.iterations = ParameterRange::span(-1, 2);
    s.a = ParameterRange::single(1);
    s.b = ParameterRange::single(1);
    QString err;
    EXPECT_FALSE(s.validate(&err));
    EXPECT_TRUE(err.contains("negative"));
}

TEST(SearchRangesTest, CountSaturatesInsteadOfOverflowing)
{
    SearchRanges s;
    s.iterations = ParameterRange::span(0, 1000000);
    s.a = ParameterRange::span(std::numeric_limits<qint64>::min() / 2, std::numeric_limits<qint64>::max() / 2);
    s.b = ParameterRange::span(0, 1000000);
    EXPECT_EQ(s.combinationCount(), std::numeric_limits<qint64>::max());
}
