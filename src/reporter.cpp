/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/reporter.hpp"
#include "fanout/registry.hpp"
#include "fanout/renderer.hpp"
#include "fanout/logger.hpp"

namespace fanout {

Reporter::Reporter(Registry& registry, EventReceiver events, Renderer& renderer) noexcept
    : registry_(registry), events_(std::move(events)), renderer_(renderer) {
}

void Reporter::run() {
    setThreadName("Reporter");

    remaining_ = registry_.size();
    renderer_.open();
    if (remaining_ == 0) {
        renderer_.draw(registry_, true);
        finalDrawn_ = true;
    }

    while (auto event = events_.recv()) {
        apply(*event);
        ++handled_;

        if (finalDrawn_) {
            continue;
        }
        if (remaining_ == 0) {
            renderer_.draw(registry_, true);
            finalDrawn_ = true;
        } else {
            renderer_.draw(registry_, false);
        }
    }

    if (!finalDrawn_) {
        LOG_DEBUG("Event channel closed with " + std::to_string(remaining_) + " task(s) outstanding");
        renderer_.close();
    }
    LOG_DEBUG("Reporter handled " + std::to_string(handled_) + " event(s)");
}

void Reporter::apply(Event& event) {
    switch (event.kind) {
        case EventKind::Update:
            // setStatus refuses to leave Completed, so each task counts once
            if (registry_.setStatus(event.id, event.status) && event.status.isCompleted() &&
                remaining_ > 0) {
                --remaining_;
            }
            break;
        case EventKind::Stderr:
            registry_.pushStderr(event.id, std::move(event.text));
            break;
        case EventKind::Stdout:
            registry_.setStdout(event.id, std::move(event.text));
            break;
    }
}

}
