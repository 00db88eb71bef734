#include <gtest/gtest.h>
#include <cstdlib>
#include <ctime>
#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "core/StudyDay.hpp"

using namespace testing_support;

namespace {

// kNow is 2023-11-14 22:13:20 UTC; the next 04:00 UTC is 20800s later.
constexpr std::time_t kNextFourAm = kNow + 20800;

class StudyDayTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("TZ", "UTC", 1);
        tzset();
    }
};

} // namespace

TEST_F(StudyDayTest, LateNightBelongsToPreviousDay) {
    StudyDay day;
    EXPECT_EQ(day.dateFor(kNow), "2023-11-14");
    EXPECT_EQ(day.dateFor(kNextFourAm - 1), "2023-11-14");
    EXPECT_EQ(day.dateFor(kNextFourAm), "2023-11-15");
    EXPECT_TRUE(day.sameDay(kNow, kNextFourAm - 1));
    EXPECT_FALSE(day.sameDay(kNow, kNextFourAm));
}

TEST_F(StudyDayTest, MidnightRollover) {
    StudyDay day(0);
    EXPECT_EQ(day.dateFor(kNow), "2023-11-14");
    EXPECT_EQ(day.dateFor(kNextFourAm - 4 * 3600), "2023-11-15");
}

TEST_F(StudyDayTest, NextRolloverIsStrictlyLater) {
    StudyDay day;
    EXPECT_EQ(day.nextRollover(kNow), kNextFourAm);
    EXPECT_EQ(day.nextRollover(kNextFourAm), kNextFourAm + kDay);
}

TEST_F(StudyDayTest, RejectsHoursOutsideTheDay) {
    EXPECT_THROW(StudyDay(-1), ValidationError);
    EXPECT_THROW(StudyDay(24), ValidationError);
}
