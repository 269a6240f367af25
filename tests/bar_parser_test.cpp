#include <gtest/gtest.h>

#include "bar_parser.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

using core::utils::makeLocalTime;
using core::utils::parseBarDate;

TEST(BarParserTest, MostRecentFirstPayloadComesOutChronological) {
    const std::string body = R"([
        {"date": "2026-03-11", "open": 3, "high": 3.5, "low": 2.5, "close": 3.2, "volume": 300},
        {"date": "2026-03-10", "open": 2, "high": 2.5, "low": 1.5, "close": 2.2, "volume": 200},
        {"date": "2026-03-09", "open": 1, "high": 1.5, "low": 0.5, "close": 1.2, "volume": 100}
    ])";

    const auto bars = data::parseBars(body);

    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[0].date, "2026-03-09");
    EXPECT_EQ(bars[2].date, "2026-03-11");
    EXPECT_EQ(bars[0].timestamp, makeLocalTime(2026, 3, 9));
    EXPECT_DOUBLE_EQ(bars[1].open, 2.0);
    EXPECT_DOUBLE_EQ(bars[1].high, 2.5);
    EXPECT_DOUBLE_EQ(bars[1].low, 1.5);
    EXPECT_DOUBLE_EQ(bars[1].close, 2.2);
    EXPECT_DOUBLE_EQ(bars[1].volume, 200.0);
}

TEST(BarParserTest, ChronologicalPayloadIsKept) {
    const std::string body = R"([
        {"date": "2026-03-11 09:30:00", "close": 1, "volume": 1},
        {"date": "2026-03-11 09:35:00", "close": 2, "volume": 1}
    ])";

    const auto bars = data::parseBars(body);

    ASSERT_EQ(bars.size(), 2u);
    EXPECT_DOUBLE_EQ(bars[0].close, 1.0);
    EXPECT_EQ(bars[1].timestamp, makeLocalTime(2026, 3, 11, 9, 35));
}

TEST(BarParserTest, MissingOrNullFieldsBecomeZero) {
    const std::string body = R"([
        {"date": "2026-03-11", "open": null, "close": "n/a"}
    ])";

    const auto bars = data::parseBars(body);

    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].open, 0.0);
    EXPECT_DOUBLE_EQ(bars[0].high, 0.0);
    EXPECT_DOUBLE_EQ(bars[0].low, 0.0);
    EXPECT_DOUBLE_EQ(bars[0].close, 0.0);
    EXPECT_DOUBLE_EQ(bars[0].volume, 0.0);
}

TEST(BarParserTest, BarsWithoutUsableDateAreSkipped) {
    const std::string body = R"([
        {"date": "2026-03-11", "close": 5},
        {"date": "yesterday", "close": 4},
        {"close": 3},
        42,
        {"date": "2026-03-09", "close": 2}
    ])";

    const auto bars = data::parseBars(body);

    ASSERT_EQ(bars.size(), 2u);
    EXPECT_DOUBLE_EQ(bars[0].close, 2.0);
    EXPECT_DOUBLE_EQ(bars[1].close, 5.0);
}

TEST(BarParserTest, EmptyArrayIsEmptySeries) {
    EXPECT_TRUE(data::parseBars("[]").empty());
}

TEST(BarParserTest, NonArrayBodyThrows) {
    EXPECT_THROW(data::parseBars(R"({"detail": "Not found"})"), core::ParseException);
    EXPECT_THROW(data::parseBars("not json"), core::ParseException);
}

TEST(BarDateTest, AcceptsBackendFormats) {
    EXPECT_EQ(parseBarDate("2026-01-08"), makeLocalTime(2026, 1, 8));
    EXPECT_EQ(parseBarDate("2026-01-08 15:55:00"), makeLocalTime(2026, 1, 8, 15, 55));
    EXPECT_EQ(parseBarDate("2026-01-08 15:55"), makeLocalTime(2026, 1, 8, 15, 55));
    EXPECT_EQ(parseBarDate("2026-01-08T15:55:30"), makeLocalTime(2026, 1, 8, 15, 55, 30));
}

TEST(BarDateTest, OffsetIsHonoured) {
    const auto utc = parseBarDate("2026-01-08T20:55:00Z");
    const auto eastern = parseBarDate("2026-01-08T15:55:00-05:00");
    EXPECT_EQ(utc, eastern);
}

TEST(BarDateTest, RejectsGarbage) {
    EXPECT_THROW(parseBarDate(""), core::ParseException);
    EXPECT_THROW(parseBarDate("2026/01/08"), core::ParseException);
    EXPECT_THROW(parseBarDate("2026-13-45"), core::ParseException);
}
