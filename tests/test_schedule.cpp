#include <gtest/gtest.h>
#include "ncf_schedule.hpp"

using namespace ncf;

namespace {

PresetWindow window(const char* start, const char* end) {
    return PresetWindow{"w", *TimeOfDay::parse(start), *TimeOfDay::parse(end), true};
}

TimeOfDay at(const char* hhmm) { return *TimeOfDay::parse(hhmm); }

} // namespace

// ==================== TimeOfDay ====================

TEST(TimeOfDayTest, ParsesStrictHHMM) {
    auto t = TimeOfDay::parse("07:05");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->hour, 7);
    EXPECT_EQ(t->minute, 5);
    EXPECT_EQ(t->minutes(), 425);

    EXPECT_TRUE(TimeOfDay::parse("00:00").has_value());
    EXPECT_TRUE(TimeOfDay::parse("23:59").has_value());
}

TEST(TimeOfDayTest, RejectsMalformedTimes) {
    EXPECT_FALSE(TimeOfDay::parse("24:00").has_value());
    EXPECT_FALSE(TimeOfDay::parse("12:60").has_value());
    EXPECT_FALSE(TimeOfDay::parse("7:00").has_value());
    EXPECT_FALSE(TimeOfDay::parse("07-00").has_value());
    EXPECT_FALSE(TimeOfDay::parse("0700").has_value());
    EXPECT_FALSE(TimeOfDay::parse("ab:cd").has_value());
    EXPECT_FALSE(TimeOfDay::parse("").has_value());
    EXPECT_FALSE(TimeOfDay::parse("07:00:00").has_value());
}

TEST(TimeOfDayTest, FormatsWithLeadingZeros) {
    EXPECT_EQ((TimeOfDay{6, 0}).to_string(), "06:00");
    EXPECT_EQ((TimeOfDay{21, 5}).to_string(), "21:05");
}

TEST(TimeOfDayTest, Ordering) {
    EXPECT_LT(at("06:59"), at("07:00"));
    EXPECT_EQ(at("12:00"), (TimeOfDay{12, 0}));
    EXPECT_GE(at("23:59"), at("00:00"));
}

// ==================== should_block ====================

TEST(ShouldBlockTest, SameDayWindowIsHalfOpen) {
    auto w = window("12:00", "13:00");
    EXPECT_FALSE(should_block(at("11:59"), w));
    EXPECT_TRUE(should_block(at("12:00"), w));
    EXPECT_TRUE(should_block(at("12:30"), w));
    EXPECT_TRUE(should_block(at("12:59"), w));
    EXPECT_FALSE(should_block(at("13:00"), w));
}

TEST(ShouldBlockTest, OvernightWindowWrapsMidnight) {
    auto w = window("21:00", "06:00");
    EXPECT_TRUE(should_block(at("21:00"), w));
    EXPECT_TRUE(should_block(at("23:59"), w));
    EXPECT_TRUE(should_block(at("00:00"), w));
    EXPECT_TRUE(should_block(at("05:59"), w));
    EXPECT_FALSE(should_block(at("06:00"), w));
    EXPECT_FALSE(should_block(at("12:00"), w));
    EXPECT_FALSE(should_block(at("20:59"), w));
}

TEST(ShouldBlockTest, ZeroLengthWindowNeverBlocks) {
    auto w = window("10:00", "10:00");
    EXPECT_FALSE(should_block(at("09:59"), w));
    EXPECT_FALSE(should_block(at("10:00"), w));
    EXPECT_FALSE(should_block(at("10:01"), w));
}

TEST(ShouldBlockTest, WholeDayMinusOneMinute) {
    auto w = window("00:00", "23:59");
    EXPECT_TRUE(should_block(at("00:00"), w));
    EXPECT_TRUE(should_block(at("23:58"), w));
    EXPECT_FALSE(should_block(at("23:59"), w));
}

TEST(ShouldBlockTest, EveryMinuteMatchesComplementOfOvernightWindow) {
    // Overnight window and its same-day complement partition the day
    auto overnight = window("22:30", "05:15");
    auto daytime = window("05:15", "22:30");
    for (int m = 0; m < 24 * 60; ++m) {
        TimeOfDay t{m / 60, m % 60};
        EXPECT_NE(should_block(t, overnight), should_block(t, daytime)) << t.to_string();
    }
}

// ==================== Defaults ====================

TEST(DefaultPresetsTest, FourEnabledPresets) {
    PresetTable t = default_presets();
    ASSERT_EQ(t.size(), 4u);

    EXPECT_EQ(t.at("Breakfast").start.to_string(), "07:00");
    EXPECT_EQ(t.at("Breakfast").end.to_string(), "08:00");
    EXPECT_EQ(t.at("Lunch").start.to_string(), "12:00");
    EXPECT_EQ(t.at("Lunch").end.to_string(), "13:00");
    EXPECT_EQ(t.at("Dinner").start.to_string(), "19:00");
    EXPECT_EQ(t.at("Dinner").end.to_string(), "20:00");
    EXPECT_EQ(t.at("Bedtime").start.to_string(), "21:00");
    EXPECT_EQ(t.at("Bedtime").end.to_string(), "06:00");

    for (const auto& [name, w] : t) {
        EXPECT_EQ(w.name, name);
        EXPECT_TRUE(w.enabled);
    }
    EXPECT_EQ(t.count(kManualMode), 0u);
}
