/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/multiplexer.hpp"
#include "fanout/event.hpp"
#include "fanout/pool.hpp"
#include "fanout/process.hpp"
#include "fanout/processor.hpp"
#include "fanout/registry.hpp"
#include "fanout/renderer.hpp"
#include "fanout/reporter.hpp"
#include "fanout/logger.hpp"
#include <atomic>
#include <climits>
#include <system_error>
#include <thread>

namespace fanout {

Multiplexer::Multiplexer(MultiplexerConfig config, std::vector<std::string> commands)
    : config_(std::move(config)), commands_(std::move(commands)) {
    LOG_DEBUG("Multiplexer created - tasks: " + std::to_string(commands_.size()) +
              ", parallelism: " + std::to_string(parallelism()) +
              ", stderr lines: " + std::to_string(config_.stderrLines));
}

std::size_t Multiplexer::parallelism() const noexcept {
    std::size_t cap = config_.parallelism.value_or(commands_.size());
    if (cap > commands_.size()) cap = commands_.size();
    if (cap > static_cast<std::size_t>(INT_MAX)) cap = INT_MAX;
    return cap == 0 ? 1 : cap;
}

RunResult Multiplexer::run(Renderer& renderer, const InterruptCheck& interrupted) {
    RunResult outcome;
    if (config_.program.empty()) {
        outcome.error = RunError::SystemError;
        outcome.message = "no program to run commands with";
        return outcome;
    }

    const std::size_t total = commands_.size();
    const auto started = std::chrono::system_clock::now();

    Registry registry(commands_, config_.stderrLines);
    auto channel = makeChannel<Event>();
    EventSender events = std::move(channel.first);
    Reporter reporter(registry, std::move(channel.second), renderer);
    ProcessTable table;
    Processor processor(config_.program, commands_, table);
    Arbiter arbiter;
    std::atomic<std::size_t> finished{0};

    std::thread reporterThread;
    try {
        reporterThread = std::thread([&reporter, &arbiter] {
            try {
                reporter.run();
            } catch (const std::exception& e) {
                LOG_ERROR("Reporter failed: " + std::string(e.what()));
            }
            arbiter.resolve(RunEnd::ReporterDrained);
        });
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start reporter: " + std::string(e.what()));
        outcome.error = RunError::SystemError;
        outcome.message = std::string("failed to start reporter: ") + e.what();
        return outcome;
    }

    // The pool's processor owns the only sender from here on, so the channel
    // closes once the pool has been stopped.
    Pool pool(static_cast<int>(parallelism()));
    bool poolStarted = pool.start(
        [&processor, &finished, &arbiter, total, events = std::move(events)](TaskId id, int) {
            (void)processor.process(id, events);
            if (finished.fetch_add(1) + 1 == total) {
                arbiter.resolve(RunEnd::PoolDrained);
            }
        });
    if (!poolStarted) {
        pool.stop();
        reporterThread.join();
        outcome.error = RunError::SystemError;
        outcome.message = "failed to start worker pool";
        return outcome;
    }

    LOG_INFO("Running " + std::to_string(total) + " command(s) with parallelism " +
             std::to_string(pool.workerCount()));
    if (total == 0) {
        arbiter.resolve(RunEnd::PoolDrained);
    }
    for (TaskId id = 0; id < total; ++id) {
        pool.submit(id);
    }

    const RunEnd end = arbiter.wait(interrupted);
    const auto ended = std::chrono::system_clock::now();

    if (end == RunEnd::Interrupted) {
        LOG_WARN("Run interrupted, terminating " + std::to_string(table.size()) + " running process(es)");
        pool.requestStop();
        (void)table.terminateAll(config_.terminateGrace);
        pool.stop();
        reporterThread.join();

        outcome.error = RunError::Interrupted;
        outcome.message = "user interrupt";
        return outcome;
    }

    // Let the reporter apply every outstanding event before taking the snapshot
    pool.stop();
    reporterThread.join();

    outcome.result = assembleResult(registry, started, ended);
    outcome.ok = true;

    std::size_t succeeded = 0;
    for (const auto& task : registry.tasks()) {
        if (task.status.isSuccess()) ++succeeded;
    }
    LOG_INFO("Run completed: " + std::to_string(succeeded) + "/" + std::to_string(total) +
             " task(s) succeeded");
    return outcome;
}

}
