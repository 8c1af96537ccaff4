/**
 * @file test_registry.cpp
 * @brief Unit tests for the task registry
 *
 * Covers id assignment, forward-only status transitions and the bounded
 * stderr tail.
 */

#include <gtest/gtest.h>
#include "fanout/registry.hpp"

#include <string>
#include <vector>

namespace fanout {
namespace testing {

class RegistryTest : public ::testing::Test {
protected:
    std::vector<std::string> commands_{"echo a", "echo b", "echo c"};
};

// Test ids are dense and follow input order
TEST_F(RegistryTest, AssignsDenseIds) {
    Registry registry(commands_, 3);

    ASSERT_EQ(registry.size(), 3u);
    for (TaskId id = 0; id < registry.size(); ++id) {
        EXPECT_EQ(registry.at(id).id, id);
        EXPECT_EQ(registry.at(id).command, commands_[id]);
        EXPECT_EQ(registry.at(id).status, TaskStatus::pending());
        EXPECT_TRUE(registry.at(id).stdoutContent.empty());
    }
}

// Test statuses only move forward
TEST_F(RegistryTest, RejectsBackwardTransitions) {
    Registry registry(commands_, 3);

    EXPECT_TRUE(registry.setStatus(0, TaskStatus::running()));
    EXPECT_FALSE(registry.setStatus(0, TaskStatus::pending()));
    EXPECT_TRUE(registry.setStatus(0, TaskStatus::failed(2)));
    EXPECT_FALSE(registry.setStatus(0, TaskStatus::running()));
    EXPECT_FALSE(registry.setStatus(0, TaskStatus::succeeded()));

    EXPECT_EQ(registry.at(0).status, TaskStatus::failed(2));
}

// Test a task that never ran may complete directly
TEST_F(RegistryTest, AllowsPendingToCompleted) {
    Registry registry(commands_, 3);
    EXPECT_TRUE(registry.setStatus(1, TaskStatus::failed(std::nullopt)));
    EXPECT_TRUE(registry.at(1).status.isCompleted());
    EXPECT_FALSE(registry.at(1).status.exitCode.has_value());
}

// Test unknown ids are refused
TEST_F(RegistryTest, RejectsUnknownIds) {
    Registry registry(commands_, 3);
    EXPECT_FALSE(registry.setStatus(3, TaskStatus::running()));
    EXPECT_FALSE(registry.pushStderr(3, "x"));
    EXPECT_FALSE(registry.setStdout(3, "x"));
}

// Test stderr keeps exactly the most recent lines in order
TEST_F(RegistryTest, StderrTailEvictsOldest) {
    Registry registry(commands_, 3);
    for (int i = 1; i <= 5; ++i) {
        registry.pushStderr(0, "line " + std::to_string(i));
    }

    const auto& tail = registry.at(0).recentStderr;
    ASSERT_EQ(tail.size(), 3u);
    EXPECT_EQ(tail[0], "line 3");
    EXPECT_EQ(tail[1], "line 4");
    EXPECT_EQ(tail[2], "line 5");
}

TEST_F(RegistryTest, ZeroCapacityKeepsNothing) {
    Registry registry(commands_, 0);
    registry.pushStderr(2, "dropped");
    EXPECT_TRUE(registry.at(2).recentStderr.empty());
}

// Test stdout is replaced wholesale
TEST_F(RegistryTest, StdoutReplaced) {
    Registry registry(commands_, 3);
    registry.setStdout(1, "first");
    registry.setStdout(1, "second\n");
    EXPECT_EQ(registry.at(1).stdoutContent, "second\n");
}

TEST_F(RegistryTest, CountsPhases) {
    Registry registry(commands_, 3);
    registry.setStatus(0, TaskStatus::running());
    registry.setStatus(1, TaskStatus::running());
    registry.setStatus(1, TaskStatus::succeeded());

    EXPECT_EQ(registry.countIn(Phase::Pending), 1u);
    EXPECT_EQ(registry.countIn(Phase::Running), 1u);
    EXPECT_EQ(registry.countIn(Phase::Completed), 1u);
}

TEST(TaskStatusTest, FormatsOutcomes) {
    EXPECT_EQ(toString(TaskStatus::pending()), "PENDING");
    EXPECT_EQ(toString(TaskStatus::running()), "RUNNING");
    EXPECT_EQ(toString(TaskStatus::succeeded()), "SUCCESS (0)");
    EXPECT_EQ(toString(TaskStatus::failed(7)), "FAILED (7)");
    EXPECT_EQ(toString(TaskStatus::failed(std::nullopt)), "FAILED (unknown)");
}

TEST(TaskStatusTest, SignalFailureDiffersFromExitCode) {
    EXPECT_NE(TaskStatus::failed(std::nullopt), TaskStatus::failed(0));
    EXPECT_NE(TaskStatus::failed(std::nullopt), TaskStatus::failed(1));
    EXPECT_FALSE(TaskStatus::failed(0).isSuccess());
}

}
}
