#include "matrix_controller/utils/CommandWatchdog.hpp"
#include "gtest/gtest.h"

using namespace matrix_controller;
using namespace std::chrono_literals;

namespace
{
TEST(CommandWatchdogTest, DoesNotTripBeforeFirstCommand)
{
    CommandWatchdog watchdog(100ms);
    auto start = CommandWatchdog::Clock::now();
    EXPECT_FALSE(watchdog.CheckExpired(start + 10s));
}

TEST(CommandWatchdogTest, TripsOnceAfterTimeout)
{
    CommandWatchdog watchdog(100ms);
    auto start = CommandWatchdog::Clock::now();
    watchdog.Feed(start);
    EXPECT_FALSE(watchdog.CheckExpired(start + 50ms));
    EXPECT_FALSE(watchdog.CheckExpired(start + 100ms));
    EXPECT_TRUE(watchdog.CheckExpired(start + 101ms));
    EXPECT_FALSE(watchdog.CheckExpired(start + 500ms));
}

TEST(CommandWatchdogTest, RearmsOnNextCommand)
{
    CommandWatchdog watchdog(100ms);
    auto start = CommandWatchdog::Clock::now();
    watchdog.Feed(start);
    EXPECT_TRUE(watchdog.CheckExpired(start + 200ms));
    watchdog.Feed(start + 300ms);
    EXPECT_FALSE(watchdog.CheckExpired(start + 350ms));
    EXPECT_TRUE(watchdog.CheckExpired(start + 450ms));
}

TEST(CommandWatchdogTest, RearmTripsAgain)
{
    CommandWatchdog watchdog(100ms);
    auto start = CommandWatchdog::Clock::now();
    watchdog.Feed(start);
    EXPECT_TRUE(watchdog.CheckExpired(start + 200ms));
    watchdog.Rearm();
    EXPECT_TRUE(watchdog.CheckExpired(start + 300ms));
    EXPECT_FALSE(watchdog.CheckExpired(start + 400ms));
}
} // namespace
