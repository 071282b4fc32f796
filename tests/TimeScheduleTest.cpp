#include "TestSupport.hpp"

#include "proxyrot/rotation/TimeSchedule.hpp"

#include <gtest/gtest.h>

namespace proxyrot::rotation {
namespace {

model::ScheduleWindow window(const std::string& name, int start, int end, int priority = 0) {
    model::ScheduleWindow result;
    result.name = name;
    result.startHour = start;
    result.endHour = end;
    result.priority = priority;
    return result;
}

TEST(TimeScheduleTest, CivilTimeIsUtc) {
    auto civil = civilTimeUtc(test::utcSundayAt(5));
    EXPECT_EQ(civil.hour, 5);
    EXPECT_EQ(civil.dayOfWeek, 0);

    civil = civilTimeUtc(test::utcSundayAt(24 + 13));
    EXPECT_EQ(civil.hour, 13);
    EXPECT_EQ(civil.dayOfWeek, 1);
}

TEST(TimeScheduleTest, DaytimeWindowIsHalfOpen) {
    auto business = window("business", 9, 17);
    EXPECT_FALSE(windowCovers(business, {8, 1}));
    EXPECT_TRUE(windowCovers(business, {9, 1}));
    EXPECT_TRUE(windowCovers(business, {16, 1}));
    EXPECT_FALSE(windowCovers(business, {17, 1}));
}

TEST(TimeScheduleTest, OvernightWindowWrapsPastMidnight) {
    auto night = window("night", 22, 6);
    EXPECT_TRUE(windowCovers(night, {23, 3}));
    EXPECT_TRUE(windowCovers(night, {0, 3}));
    EXPECT_TRUE(windowCovers(night, {5, 3}));
    EXPECT_FALSE(windowCovers(night, {6, 3}));
    EXPECT_FALSE(windowCovers(night, {21, 3}));
}

TEST(TimeScheduleTest, EqualBoundsCoverWholeDay) {
    auto always = window("always", 8, 8);
    for (int hour = 0; hour < 24; ++hour) {
        EXPECT_TRUE(windowCovers(always, {hour, 2}));
    }
    EXPECT_TRUE(windowCovers(window("default", 0, 24), {23, 6}));
}

TEST(TimeScheduleTest, DaysOfWeekRestrictWindow) {
    auto weekend = window("weekend", 0, 24);
    weekend.daysOfWeek = {0, 6};
    EXPECT_TRUE(windowCovers(weekend, {12, 0}));
    EXPECT_TRUE(windowCovers(weekend, {12, 6}));
    EXPECT_FALSE(windowCovers(weekend, {12, 3}));
}

TEST(TimeScheduleTest, HighestPriorityWindowWins) {
    std::vector<model::ScheduleWindow> windows{window("all-day", 0, 24, 1), window("afternoon", 12, 18, 5),
                                               window("late", 12, 20, 5)};
    const auto* match = matchWindow(windows, test::utcSundayAt(14));
    ASSERT_NE(match, nullptr);
    EXPECT_EQ(match->name, "afternoon");

    match = matchWindow(windows, test::utcSundayAt(19));
    ASSERT_NE(match, nullptr);
    EXPECT_EQ(match->name, "late");

    match = matchWindow(windows, test::utcSundayAt(3));
    ASSERT_NE(match, nullptr);
    EXPECT_EQ(match->name, "all-day");
}

TEST(TimeScheduleTest, NoCoveringWindow) {
    std::vector<model::ScheduleWindow> windows{window("business", 9, 17)};
    EXPECT_EQ(matchWindow(windows, test::utcSundayAt(20)), nullptr);
    EXPECT_EQ(matchWindow({}, test::utcSundayAt(20)), nullptr);
}

} // namespace
} // namespace proxyrot::rotation
