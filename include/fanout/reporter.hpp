/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>

#include "fanout/event.hpp"

namespace fanout {

class Registry;
class Renderer;

// Single consumer of the event channel and the only writer of the registry.
class Reporter final {
public:
    Reporter(Registry& registry, EventReceiver events, Renderer& renderer) noexcept;

    Reporter(const Reporter&) = delete;
    Reporter& operator=(const Reporter&) = delete;

    // Consumes events until every sender is gone and the channel is empty.
    void run();

    [[nodiscard]] std::size_t remaining() const noexcept { return remaining_; }
    [[nodiscard]] std::size_t eventsHandled() const noexcept { return handled_; }

private:
    void apply(Event& event);

    Registry& registry_;
    EventReceiver events_;
    Renderer& renderer_;
    std::size_t remaining_ = 0;
    std::size_t handled_ = 0;
    bool finalDrawn_ = false;
};

}
