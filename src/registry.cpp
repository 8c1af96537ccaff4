/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/registry.hpp"
#include "fanout/logger.hpp"

namespace fanout {

std::string toString(const TaskStatus& status) {
    switch (status.phase) {
        case Phase::Pending: return "PENDING";
        case Phase::Running: return "RUNNING";
        case Phase::Completed: break;
    }
    if (status.outcome == Outcome::Success) {
        return "SUCCESS (0)";
    }
    return "FAILED (" + (status.exitCode ? std::to_string(*status.exitCode) : std::string("unknown")) + ")";
}

Registry::Registry(const std::vector<std::string>& commands, std::size_t stderrCapacity)
    : stderrCapacity_(stderrCapacity) {
    tasks_.reserve(commands.size());
    for (std::size_t i = 0; i < commands.size(); ++i) {
        Task task;
        task.id = i;
        task.command = commands[i];
        tasks_.push_back(std::move(task));
    }
}

bool Registry::setStatus(TaskId id, TaskStatus status) noexcept {
    if (!contains(id)) {
        LOG_WARN("Status update for unknown task " + std::to_string(id));
        return false;
    }

    Task& task = tasks_[id];
    // Completed is terminal; Pending is never re-entered
    if (task.status.phase == Phase::Completed || status.phase < task.status.phase ||
        status.phase == Phase::Pending) {
        LOG_WARN("Ignoring transition " + toString(task.status) + " -> " + toString(status) +
                 " for task " + std::to_string(id));
        return false;
    }

    task.status = status;
    return true;
}

bool Registry::pushStderr(TaskId id, std::string line) {
    if (!contains(id)) {
        LOG_WARN("Stderr line for unknown task " + std::to_string(id));
        return false;
    }

    auto& recent = tasks_[id].recentStderr;
    recent.push_back(std::move(line));
    while (recent.size() > stderrCapacity_) {
        recent.pop_front();
    }
    return true;
}

bool Registry::setStdout(TaskId id, std::string content) noexcept {
    if (!contains(id)) {
        LOG_WARN("Stdout for unknown task " + std::to_string(id));
        return false;
    }
    tasks_[id].stdoutContent = std::move(content);
    return true;
}

std::size_t Registry::countIn(Phase phase) const noexcept {
    std::size_t count = 0;
    for (const auto& task : tasks_) {
        if (task.status.phase == phase) ++count;
    }
    return count;
}

}
