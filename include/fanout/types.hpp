/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace fanout {

// Position of a command in the resolved command list.
using TaskId = std::size_t;

// Core task lifecycle phases. Transitions only move forward.
enum class Phase : std::uint8_t { Pending, Running, Completed };

enum class Outcome : std::uint8_t { Success, Failed };

struct TaskStatus {
    Phase phase = Phase::Pending;
    Outcome outcome = Outcome::Failed;
    // Set for processes that exited normally. Absent when the process was
    // killed by a signal or never got to run.
    std::optional<int> exitCode;

    [[nodiscard]] static TaskStatus pending() noexcept { return TaskStatus{}; }
    [[nodiscard]] static TaskStatus running() noexcept {
        return TaskStatus{Phase::Running, Outcome::Failed, std::nullopt};
    }
    [[nodiscard]] static TaskStatus succeeded() noexcept {
        return TaskStatus{Phase::Completed, Outcome::Success, 0};
    }
    [[nodiscard]] static TaskStatus failed(std::optional<int> code) noexcept {
        return TaskStatus{Phase::Completed, Outcome::Failed, code};
    }

    [[nodiscard]] bool isCompleted() const noexcept { return phase == Phase::Completed; }
    [[nodiscard]] bool isSuccess() const noexcept {
        return phase == Phase::Completed && outcome == Outcome::Success;
    }

    bool operator==(const TaskStatus& other) const noexcept {
        if (phase != other.phase) return false;
        if (phase != Phase::Completed) return true;
        return outcome == other.outcome && exitCode == other.exitCode;
    }
    bool operator!=(const TaskStatus& other) const noexcept { return !(*this == other); }
};

std::string toString(const TaskStatus& status);

} // namespace fanout
