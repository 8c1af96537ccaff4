/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <iosfwd>

namespace fanout {

class Registry;

// Invoked by the reporter after every registry mutation.
class Renderer {
public:
    virtual ~Renderer() = default;

    // Before the first event.
    virtual void open() noexcept {}

    // `completed` is set exactly once, for the final frame after the last
    // task finished.
    virtual void draw(const Registry& registry, bool completed) noexcept = 0;

    // The run ended without a final frame (aborted).
    virtual void close() noexcept {}
};

class NullRenderer final : public Renderer {
public:
    void draw(const Registry&, bool) noexcept override {}
};

// Live dashboard on an ANSI terminal. Redraws in the alternate screen while
// tasks run and prints the final frame to the normal screen so it stays in
// the scrollback.
class TerminalDashboard final : public Renderer {
public:
    explicit TerminalDashboard(std::ostream& out) noexcept;

    void open() noexcept override;
    void draw(const Registry& registry, bool completed) noexcept override;
    void close() noexcept override;

private:
    void leaveAlternateScreen() noexcept;

    std::ostream& out_;
    bool alternate_ = false;
};

}
