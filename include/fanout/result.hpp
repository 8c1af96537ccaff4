/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "fanout/types.hpp"

namespace fanout {

class Registry;

using Timestamp = std::chrono::system_clock::time_point;

struct ResultMetadata {
    Timestamp started;
    Timestamp ended;
};

struct TaskOutput {
    std::string stdoutContent;
};

// Snapshot of a completed run: timestamps plus every task's stdout.
struct Result {
    ResultMetadata metadata;
    std::map<TaskId, TaskOutput> tasks;
};

[[nodiscard]] Result assembleResult(const Registry& registry, Timestamp started, Timestamp ended);

enum class OutputFormat : std::uint8_t { Json, Yaml };

[[nodiscard]] std::optional<OutputFormat> parseOutputFormat(const std::string& name) noexcept;
[[nodiscard]] const char* toString(OutputFormat format) noexcept;

class ResultFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] std::string serializeResult(const Result& result, OutputFormat format);

// Throws ResultFormatError on malformed input.
[[nodiscard]] Result parseResult(const std::string& text, OutputFormat format);

// RFC 3339, UTC, nanosecond fraction: 2026-10-18T09:00:00.123456789Z
[[nodiscard]] std::string formatTimestamp(Timestamp timestamp);
[[nodiscard]] std::optional<Timestamp> parseTimestamp(const std::string& text) noexcept;

}
