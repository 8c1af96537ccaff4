/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "fanout/multiplexer.hpp"
#include "fanout/result.hpp"

namespace fanout {

constexpr const char* kDefaultProgram = "/bin/sh -c";
constexpr std::size_t kDefaultStderrLines = 3;

struct Options {
    bool experimental = false;
    bool showHelp = false;
    bool showVersion = false;
    std::vector<std::string> program;
    std::size_t stderrLines = kDefaultStderrLines;
    std::optional<std::size_t> parallelism;
    std::optional<OutputFormat> stdoutFormat;
    std::vector<std::string> commands;  // inline, in given order
    std::vector<std::string> files;     // command files, in given order

    [[nodiscard]] MultiplexerConfig toConfig() const;
};

struct OptionsResult {
    bool ok = false;
    Options options;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Parses command line arguments (without argv[0]) and applies the
// experimental gate.
[[nodiscard]] OptionsResult parseOptions(const std::vector<std::string>& args);

// Splits an interpreter prefix such as "/bin/sh -c" on whitespace.
[[nodiscard]] std::vector<std::string> splitProgram(const std::string& program);

}
