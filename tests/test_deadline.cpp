// tests/test_deadline.cpp
#include <chrono>
#include <thread>

#include "gtest/gtest.h"

#include "../src/resilience/Deadline.hpp"

TEST(DeadlineTest, RemainingShrinksTowardZero) {
    Deadline deadline = Deadline::after(std::chrono::milliseconds(500));
    EXPECT_FALSE(deadline.expired());
    EXPECT_GT(deadline.remaining(), std::chrono::milliseconds(0));
    EXPECT_LE(deadline.remaining(), std::chrono::milliseconds(500));
}

TEST(DeadlineTest, ExpiresAtItsTimePoint) {
    Deadline deadline = Deadline::after(std::chrono::milliseconds(20));
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    EXPECT_TRUE(deadline.expired());
    EXPECT_FALSE(deadline.isCancelled());
    EXPECT_EQ(deadline.remaining(), std::chrono::milliseconds(0));
}

TEST(DeadlineTest, CancelExpiresImmediately) {
    Deadline deadline = Deadline::after(std::chrono::seconds(30));
    deadline.cancel();
    deadline.cancel();
    EXPECT_TRUE(deadline.expired());
    EXPECT_TRUE(deadline.isCancelled());
    EXPECT_EQ(deadline.remaining(), std::chrono::milliseconds(0));
}

TEST(DeadlineTest, SleepForCompletesWithinDeadline) {
    Deadline deadline = Deadline::after(std::chrono::seconds(5));
    EXPECT_TRUE(deadline.sleepFor(std::chrono::milliseconds(10)));
}

TEST(DeadlineTest, SleepPastDeadlineReturnsFalseAtExpiry) {
    Deadline deadline = Deadline::after(std::chrono::milliseconds(30));
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(deadline.sleepFor(std::chrono::seconds(5)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST(DeadlineTest, CancelWakesSleeper) {
    Deadline deadline = Deadline::after(std::chrono::seconds(30));
    std::thread canceller([&deadline]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        deadline.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(deadline.sleepFor(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    canceller.join();
}
