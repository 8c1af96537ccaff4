/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <utility>

#include "fanout/channel.hpp"
#include "fanout/types.hpp"

namespace fanout {

enum class EventKind : std::uint8_t {
    Update,  // status transition
    Stderr,  // one stderr line, newline stripped
    Stdout   // complete stdout of the process
};

// Message sent from a worker to the reporter. Events for one task arrive in
// the order they were sent: Running, Stderr..., Stdout, Completed.
struct Event {
    EventKind kind = EventKind::Update;
    TaskId id = 0;
    TaskStatus status;
    std::string text;

    [[nodiscard]] static Event update(TaskId id, TaskStatus status) {
        return Event{EventKind::Update, id, status, {}};
    }
    [[nodiscard]] static Event stderrLine(TaskId id, std::string line) {
        return Event{EventKind::Stderr, id, {}, std::move(line)};
    }
    [[nodiscard]] static Event stdoutContent(TaskId id, std::string content) {
        return Event{EventKind::Stdout, id, {}, std::move(content)};
    }
};

using EventSender = Sender<Event>;
using EventReceiver = Receiver<Event>;

} // namespace fanout
