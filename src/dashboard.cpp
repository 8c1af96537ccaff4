/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/renderer.hpp"
#include "fanout/registry.hpp"
#include "fanout/logger.hpp"
#include <ostream>
#include <sstream>

namespace {

constexpr const char* kEnterAlternate = "\033[?1049h";
constexpr const char* kLeaveAlternate = "\033[?1049l";
constexpr const char* kClearHome = "\033[2J\033[H";
constexpr const char* kReset = "\033[0m";

const char* statusColor(const fanout::TaskStatus& status) {
    if (!status.isCompleted()) return "\033[33m";
    return status.isSuccess() ? "\033[32m" : "\033[31m";
}

// Commands spanning several lines are shown on one
std::string singleLine(const std::string& command) {
    std::string line;
    line.reserve(command.size());
    for (char c : command) {
        line.push_back(c == '\n' || c == '\r' ? ' ' : c);
    }
    auto first = line.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    auto last = line.find_last_not_of(" \t");
    return line.substr(first, last - first + 1);
}

}

namespace fanout {

TerminalDashboard::TerminalDashboard(std::ostream& out) noexcept : out_(out) {
}

void TerminalDashboard::open() noexcept {
    try {
        out_ << kEnterAlternate << std::flush;
        alternate_ = true;
    } catch (const std::exception& e) {
        LOG_WARN("Dashboard unavailable: " + std::string(e.what()));
    }
}

void TerminalDashboard::leaveAlternateScreen() noexcept {
    if (!alternate_) return;
    alternate_ = false;
    try {
        out_ << kLeaveAlternate << std::flush;
    } catch (const std::exception& e) {
        LOG_WARN("Failed to restore terminal: " + std::string(e.what()));
    }
}

void TerminalDashboard::draw(const Registry& registry, bool completed) noexcept {
    // Final frame goes to the normal screen
    if (completed) {
        leaveAlternateScreen();
    }

    try {
        std::ostringstream frame;
        if (!completed) {
            frame << kClearHome;
        }

        for (const auto& task : registry.tasks()) {
            frame << "⇒ (" << task.id << ") " << singleLine(task.command) << "\n";
            frame << " ↳ Status: " << statusColor(task.status) << toString(task.status) << kReset << "\n";

            if (!task.recentStderr.empty()) {
                frame << " ↳ Stderr: \n";
                for (const auto& line : task.recentStderr) {
                    frame << "   |> " << line << "\n";
                }
            }
        }

        std::size_t done = registry.countIn(Phase::Completed);
        frame << "\n";
        frame << "\033[90m" << done << "/" << registry.size() << " done, "
              << registry.countIn(Phase::Running) << " running" << kReset << "\n";
        frame << "Working...";
        if (completed) {
            frame << " DONE\n";
        }

        out_ << frame.str() << std::flush;
    } catch (const std::exception& e) {
        LOG_WARN("Dashboard draw failed: " + std::string(e.what()));
    }
}

void TerminalDashboard::close() noexcept {
    leaveAlternateScreen();
}

}
