/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include "fanout/types.hpp"

namespace fanout {

struct Task {
    TaskId id = 0;
    std::string command;
    TaskStatus status;
    std::deque<std::string> recentStderr;  // oldest first
    std::string stdoutContent;
};

// Ordered task records indexed by TaskId. Owned and written by the reporter
// only; workers never touch it.
class Registry final {
public:
    Registry(const std::vector<std::string>& commands, std::size_t stderrCapacity);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) noexcept = default;
    Registry& operator=(Registry&&) noexcept = default;

    [[nodiscard]] std::size_t size() const noexcept { return tasks_.size(); }
    [[nodiscard]] bool contains(TaskId id) const noexcept { return id < tasks_.size(); }
    [[nodiscard]] const Task& at(TaskId id) const { return tasks_.at(id); }
    [[nodiscard]] const std::vector<Task>& tasks() const noexcept { return tasks_; }
    [[nodiscard]] std::size_t stderrCapacity() const noexcept { return stderrCapacity_; }

    // Returns false and leaves the task untouched on an unknown id or a
    // backward transition.
    bool setStatus(TaskId id, TaskStatus status) noexcept;
    bool pushStderr(TaskId id, std::string line);
    bool setStdout(TaskId id, std::string content) noexcept;

    [[nodiscard]] std::size_t countIn(Phase phase) const noexcept;

private:
    std::vector<Task> tasks_;
    std::size_t stderrCapacity_;
};

} // namespace fanout
