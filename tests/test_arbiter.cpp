/**
 * @file test_arbiter.cpp
 * @brief Unit tests for the run-end race
 */

#include <gtest/gtest.h>
#include "fanout/arbiter.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace fanout {
namespace testing {

TEST(ArbiterTest, FirstResolutionWins) {
    Arbiter arbiter;
    EXPECT_FALSE(arbiter.winner().has_value());
    EXPECT_TRUE(arbiter.resolve(RunEnd::PoolDrained));
    EXPECT_FALSE(arbiter.resolve(RunEnd::Interrupted));
    EXPECT_FALSE(arbiter.resolve(RunEnd::ReporterDrained));
    EXPECT_EQ(arbiter.winner(), RunEnd::PoolDrained);
    EXPECT_EQ(arbiter.wait({}), RunEnd::PoolDrained);
}

// Test wait() returns once another thread resolves
TEST(ArbiterTest, WaitWakesOnResolve) {
    Arbiter arbiter;
    std::thread resolver([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        arbiter.resolve(RunEnd::ReporterDrained);
    });
    EXPECT_EQ(arbiter.wait([] { return false; }), RunEnd::ReporterDrained);
    resolver.join();
}

// Test the interrupt predicate is polled while waiting
TEST(ArbiterTest, InterruptPredicateWins) {
    Arbiter arbiter;
    std::atomic<bool> flag{false};
    std::thread trigger([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        flag.store(true);
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(arbiter.wait([&] { return flag.load(); }, std::chrono::milliseconds(10)),
              RunEnd::Interrupted);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
    trigger.join();

    // Completion after the interrupt no longer changes the outcome
    EXPECT_FALSE(arbiter.resolve(RunEnd::PoolDrained));
    EXPECT_EQ(arbiter.winner(), RunEnd::Interrupted);
}

TEST(ArbiterTest, ThrowingPredicateAborts) {
    Arbiter arbiter;
    auto end = arbiter.wait([]() -> bool { throw std::runtime_error("boom"); });
    EXPECT_EQ(end, RunEnd::Interrupted);
}

}
}
