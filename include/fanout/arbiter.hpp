/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace fanout {

enum class RunEnd : std::uint8_t { Interrupted, PoolDrained, ReporterDrained };

const char* toString(RunEnd end) noexcept;

// Returns true once the run should be abandoned.
using InterruptCheck = std::function<bool()>;

// Decides how a run ends: the first resolve() wins, later ones are ignored.
class Arbiter final {
public:
    Arbiter() = default;

    Arbiter(const Arbiter&) = delete;
    Arbiter& operator=(const Arbiter&) = delete;

    // Returns true if this call decided the race.
    bool resolve(RunEnd end) noexcept;

    // Blocks until resolved. `interrupted` is polled every `pollInterval`
    // and resolves the race as Interrupted when it returns true.
    RunEnd wait(const InterruptCheck& interrupted,
                std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50));

    [[nodiscard]] std::optional<RunEnd> winner() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable resolved_;
    std::optional<RunEnd> winner_;
};

}
