/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/arbiter.hpp"
#include "fanout/logger.hpp"

namespace fanout {

const char* toString(RunEnd end) noexcept {
    switch (end) {
        case RunEnd::Interrupted: return "interrupted";
        case RunEnd::PoolDrained: return "pool drained";
        case RunEnd::ReporterDrained: return "reporter drained";
        default: return "unknown";
    }
}

bool Arbiter::resolve(RunEnd end) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (winner_) {
            return false;
        }
        winner_ = end;
    }
    resolved_.notify_all();
    LOG_DEBUG(std::string("Run resolved: ") + toString(end));
    return true;
}

RunEnd Arbiter::wait(const InterruptCheck& interrupted, std::chrono::milliseconds pollInterval) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!winner_) {
        if (interrupted) {
            lock.unlock();
            bool stop = false;
            try {
                stop = interrupted();
            } catch (const std::exception& e) {
                LOG_ERROR("Interrupt check failed, aborting run: " + std::string(e.what()));
                stop = true;
            }
            lock.lock();
            if (stop && !winner_) {
                winner_ = RunEnd::Interrupted;
                LOG_DEBUG("Run resolved: interrupted");
                break;
            }
            if (winner_) break;
        }
        resolved_.wait_for(lock, pollInterval, [this] { return winner_.has_value(); });
    }
    return *winner_;
}

std::optional<RunEnd> Arbiter::winner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return winner_;
}

}
