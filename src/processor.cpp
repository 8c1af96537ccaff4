/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/processor.hpp"
#include "fanout/process.hpp"
#include "fanout/logger.hpp"
#include <chrono>

namespace fanout {

Processor::Processor(std::vector<std::string> program, std::vector<std::string> commands,
                     ProcessTable& table)
    : program_(std::move(program)), commands_(std::move(commands)), table_(table) {
    LOG_DEBUG("Processor created for " + std::to_string(commands_.size()) + " task(s)");
}

std::vector<std::string> Processor::buildArgv(TaskId id) const {
    std::vector<std::string> argv(program_);
    argv.push_back(commands_.at(id));
    return argv;
}

TaskStatus Processor::process(TaskId id, const EventSender& events) noexcept {
    const std::string label = "task " + std::to_string(id);
    TaskStatus status = TaskStatus::failed(std::nullopt);

    try {
        events.send(Event::update(id, TaskStatus::running()));
        auto startTime = std::chrono::steady_clock::now();

        // Step 1: Spawn
        Process process(buildArgv(id), &table_);
        if (!process.spawn()) {
            LOG_WARN(label + " failed to start: " + process.error());
            events.send(Event::update(id, status));
            return status;
        }

        // Step 2: Stream stderr, collect stdout
        std::string output;
        bool drained = process.drain([&events, id](std::string line) {
            events.send(Event::stderrLine(id, std::move(line)));
        }, output);
        if (!drained) {
            LOG_WARN(label + " output error: " + process.error());
        }
        events.send(Event::stdoutContent(id, std::move(output)));

        // Step 3: Reap and classify
        auto exited = process.wait();
        if (!exited) {
            LOG_WARN(label + " wait failed: " + process.error());
        } else if (drained) {
            status = *exited;
        }

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
        LOG_DEBUG(label + " " + toString(status) + " after " + std::to_string(elapsed) + "s");
    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing " + label + ": " + std::string(e.what()));
    }

    events.send(Event::update(id, status));
    return status;
}

}
