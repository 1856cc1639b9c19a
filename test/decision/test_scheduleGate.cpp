#include <gtest/gtest.h>
#include <ros/time.h>

#include "decision/scheduleGate.hpp"
#include "motion_sentry/mock_frames.hpp"

using motion_sentry::ScheduleGate;
using motion_sentry::ScheduleWindow;

TEST(ScheduleGateTests, OvernightWindowWrapsMidnight) {
    ScheduleGate gate(ScheduleWindow{22, 6});

    for (int hour : {22, 23, 0, 3, 5}) {
        ASSERT_TRUE(gate.isActiveAt(hour)) << "hour " << hour;
    }
    for (int hour : {6, 7, 12, 21}) {
        ASSERT_FALSE(gate.isActiveAt(hour)) << "hour " << hour;
    }
}

TEST(ScheduleGateTests, SameDayWindowIsHalfOpen) {
    ScheduleGate gate(ScheduleWindow{9, 17});

    ASSERT_FALSE(gate.isActiveAt(8));
    ASSERT_TRUE(gate.isActiveAt(9));
    ASSERT_TRUE(gate.isActiveAt(16));
    ASSERT_FALSE(gate.isActiveAt(17));
    ASSERT_FALSE(gate.isActiveAt(23));
}

TEST(ScheduleGateTests, FullDayWindowIsAlwaysActive) {
    ScheduleGate gate(ScheduleWindow{0, 24});
    for (int hour = 0; hour < 24; ++hour) {
        ASSERT_TRUE(gate.isActiveAt(hour)) << "hour " << hour;
    }
}

TEST(ScheduleGateTests, EqualBoundsAreAlwaysActive) {
    ScheduleGate gate(ScheduleWindow{5, 5});
    for (int hour = 0; hour < 24; ++hour) {
        ASSERT_TRUE(gate.isActiveAt(hour)) << "hour " << hour;
    }
}

TEST(ScheduleGateTests, UsesLocalWallClock) {
    ScheduleGate gate(ScheduleWindow{22, 6});

    ASSERT_EQ(ScheduleGate::localHour(MockFrames::atLocalHour(23, 30)), 23);
    ASSERT_TRUE(gate.isActive(MockFrames::atLocalHour(23, 30)));
    ASSERT_TRUE(gate.isActive(MockFrames::atLocalHour(0, 15)));
    ASSERT_FALSE(gate.isActive(MockFrames::atLocalHour(12, 0)));
    ASSERT_FALSE(gate.isActive(MockFrames::atLocalHour(6, 0, 0)));
    ASSERT_TRUE(gate.isActive(MockFrames::atLocalHour(5, 59, 59)));
}


int main(int argc, char **argv) {
    ros::Time::init();
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
