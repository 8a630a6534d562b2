#include "termbar/format/stats_formatter.hpp"
#include <gtest/gtest.h>

using namespace termbar;
using namespace termbar::format;

namespace {

bar::BarStats finishedStats() {
    bar::BarStats stats{};
    stats.n = 10;
    stats.total = 10;
    stats.elapsed = 4.0;
    stats.rate = 2.5;
    stats.remaining = 0.0;
    stats.percentage = 100.0;
    stats.desc = "copy";
    stats.unit = "it";
    stats.completed = true;
    return stats;
}

}

TEST(StatsFormatterTest, ParsesFormatNames) {
    EXPECT_EQ(parseStatsFormat("json"), StatsFormat::JSON);
    EXPECT_EQ(parseStatsFormat("text"), StatsFormat::TEXT);
    EXPECT_EQ(parseStatsFormat("none"), StatsFormat::NONE);
    EXPECT_EQ(parseStatsFormat("yaml"), StatsFormat::NONE);
}

TEST(StatsFormatterTest, JsonCarriesAllFields) {
    auto j = statsToJson(finishedStats());
    EXPECT_EQ(j["n"].get<uint64_t>(), 10u);
    EXPECT_EQ(j["total"].get<uint64_t>(), 10u);
    EXPECT_DOUBLE_EQ(j["rate"].get<double>(), 2.5);
    EXPECT_EQ(j["desc"].get<std::string>(), "copy");
    EXPECT_TRUE(j["completed"].get<bool>());
    EXPECT_DOUBLE_EQ(j["percentage"].get<double>(), 100.0);
}

TEST(StatsFormatterTest, JsonIndefiniteUsesNulls) {
    bar::BarStats stats{};
    stats.n = 3;
    stats.unit = "B";

    auto j = statsToJson(stats);
    EXPECT_TRUE(j["percentage"].is_null());
    EXPECT_TRUE(j["remaining"].is_null());
    EXPECT_FALSE(j.contains("desc"));
}

TEST(StatsFormatterTest, TextSummary) {
    EXPECT_EQ(statsToText(finishedStats()), "copy: 10/10 it in 4.00s (2.50 it/s), 100.0%");

    bar::BarStats partial = finishedStats();
    partial.n = 5;
    partial.percentage = 50.0;
    partial.completed = false;
    EXPECT_EQ(statsToText(partial), "copy: 5/10 it in 4.00s (2.50 it/s), 50.0%, incomplete");
}

TEST(StatsFormatterTest, NoneFormatIsEmpty) {
    EXPECT_TRUE(formatStats(finishedStats(), StatsFormat::NONE).empty());
    EXPECT_EQ(formatStats(finishedStats(), StatsFormat::TEXT), statsToText(finishedStats()));
}
