/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <unordered_set>
#include <vector>

#include "fanout/types.hpp"

namespace fanout {

// Live child process groups of a run. Lets an aborted run terminate children
// that workers are still waiting on.
class ProcessTable final {
public:
    ProcessTable() = default;

    ProcessTable(const ProcessTable&) = delete;
    ProcessTable& operator=(const ProcessTable&) = delete;

    // Returns false once the table is closed; the caller must then kill the
    // child it just spawned.
    [[nodiscard]] bool add(pid_t pid);
    void remove(pid_t pid) noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    // Stops accepting new children.
    void close() noexcept;
    [[nodiscard]] bool isClosed() const noexcept;

    // Sends SIGTERM to every live process group, waits up to `grace` for the
    // workers to reap them, then sends SIGKILL to the survivors. Returns the
    // number of groups that had to be killed.
    std::size_t terminateAll(std::chrono::milliseconds grace) noexcept;

private:
    std::size_t signalAll(int signal) noexcept;

    mutable std::mutex mutex_;
    std::unordered_set<pid_t> live_;
    bool closed_ = false;
};

using LineHandler = std::function<void(std::string)>;

// A child process running `argv`, in its own process group, with stdin on
// /dev/null and stdout/stderr on pipes.
class Process final {
public:
    explicit Process(std::vector<std::string> argv, ProcessTable* table = nullptr);
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) = delete;
    Process& operator=(Process&&) = delete;

    [[nodiscard]] bool spawn() noexcept;

    // Reads both pipes until they close. Every complete stderr line goes to
    // `onStderr` as soon as it is read; stdout is accumulated into `out`.
    [[nodiscard]] bool drain(const LineHandler& onStderr, std::string& out) noexcept;

    // Reaps the child. Empty when waiting failed.
    [[nodiscard]] std::optional<TaskStatus> wait() noexcept;

    void kill(int signal) const noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return pid_ > 0 && !reaped_; }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }

    // Maps a waitpid() status to a completed TaskStatus.
    [[nodiscard]] static TaskStatus classify(int waitStatus) noexcept;

private:
    void closeFds() noexcept;
    void setError(const char* what, int err);

    std::vector<std::string> argv_;
    ProcessTable* table_;
    pid_t pid_ = -1;
    int stdoutFd_ = -1;
    int stderrFd_ = -1;
    bool registered_ = false;
    bool reaped_ = false;
    std::string error_;
};

} // namespace fanout
