/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fanout/arbiter.hpp"
#include "fanout/result.hpp"

namespace fanout {

class Renderer;

struct MultiplexerConfig {
    // Interpreter and fixed flags; the command is appended as last argument.
    std::vector<std::string> program{"/bin/sh", "-c"};
    std::size_t stderrLines = 3;
    // Maximum number of live child processes. Defaults to the task count.
    std::optional<std::size_t> parallelism;
    // Time between SIGTERM and SIGKILL when a run is interrupted.
    std::chrono::milliseconds terminateGrace{2000};
};

enum class RunError : std::uint8_t {
    None = 0,
    Interrupted,
    SystemError
};

struct RunResult {
    bool ok = false;
    RunError error = RunError::None;
    std::string message;
    Result result;  // only meaningful when ok
    explicit operator bool() const noexcept { return ok; }
};

class Multiplexer final {
public:
    Multiplexer(MultiplexerConfig config, std::vector<std::string> commands);

    Multiplexer(const Multiplexer&) = delete;
    Multiplexer& operator=(const Multiplexer&) = delete;

    // Runs every command once and blocks until all finished or `interrupted`
    // reports true. An interrupted run terminates its children and returns
    // RunError::Interrupted without a result.
    [[nodiscard]] RunResult run(Renderer& renderer, const InterruptCheck& interrupted = {});

    [[nodiscard]] std::size_t parallelism() const noexcept;

private:
    MultiplexerConfig config_;
    std::vector<std::string> commands_;
};

}
