#include <gtest/gtest.h>
#include <thread>
#include "utils/clock.hpp"
#include "utils/time_utils.hpp"

using namespace fcast;

// ============================================================================
// SystemClock
// ============================================================================

TEST(SystemClockTest, FollowsWallTime) {
    SystemClock clock;
    WallClock before = wall_now();
    WallClock t = clock.now();
    WallClock after = wall_now();

    EXPECT_LE(before, t);
    EXPECT_LE(t, after);
}

TEST(SystemClockTest, MovesWithoutBeingDriven) {
    SystemClock clock;
    WallClock first = clock.now();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_GE(time_utils::millis_between(first, clock.now()), 10);
}

// ============================================================================
// ManualClock
// ============================================================================

TEST(ManualClockTest, OnlyMovesWhenAdvanced) {
    ManualClock clock(time_utils::from_iso8601("2024-01-17T12:00:00.000Z"));
    WallClock start = clock.now();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_EQ(clock.now(), start);

    clock.advance(std::chrono::minutes(5));
    EXPECT_EQ(time_utils::to_iso8601(clock.now()), "2024-01-17T12:05:00.000Z");
}

TEST(ManualClockTest, RejectsNegativeAdvance) {
    ManualClock clock(time_utils::from_iso8601("2024-01-17T12:00:00.000Z"));
    WallClock start = clock.now();

    EXPECT_THROW(clock.advance(Duration(-1)), std::invalid_argument);
    EXPECT_EQ(clock.now(), start);

    EXPECT_NO_THROW(clock.advance(Duration(0)));
    EXPECT_EQ(clock.now(), start);
}
