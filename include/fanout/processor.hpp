/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include "fanout/event.hpp"
#include "fanout/types.hpp"

namespace fanout {

class ProcessTable;

// Executes one task inside a pool worker and reports its lifecycle as events.
class Processor {
public:
    Processor(std::vector<std::string> program, std::vector<std::string> commands,
              ProcessTable& table);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    // Runs the command to completion. Always sends Running first and a
    // Completed update last, whatever fails in between.
    TaskStatus process(TaskId id, const EventSender& events) noexcept;

    // program prefix followed by the command itself
    [[nodiscard]] std::vector<std::string> buildArgv(TaskId id) const;

private:
    std::vector<std::string> program_;
    std::vector<std::string> commands_;
    ProcessTable& table_;
};

}
