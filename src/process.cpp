/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/process.hpp"
#include "fanout/logger.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace fanout {

namespace {

constexpr std::size_t kReadChunk = 4096;

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Splits complete lines off the front of `pending`.
void flushLines(std::string& pending, const LineHandler& onLine) {
    std::size_t start = 0;
    for (;;) {
        auto nl = pending.find('\n', start);
        if (nl == std::string::npos) break;
        std::size_t end = nl;
        if (end > start && pending[end - 1] == '\r') --end;
        onLine(pending.substr(start, end - start));
        start = nl + 1;
    }
    pending.erase(0, start);
}

} // namespace

bool ProcessTable::add(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    live_.insert(pid);
    return true;
}

void ProcessTable::remove(pid_t pid) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    live_.erase(pid);
}

std::size_t ProcessTable::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

void ProcessTable::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool ProcessTable::isClosed() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t ProcessTable::signalAll(int signal) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    for (pid_t pid : live_) {
        // Children lead their own group, so this reaches grandchildren too
        if (::kill(-pid, signal) != 0 && errno != ESRCH) {
            LOG_WARN("kill(" + std::to_string(-pid) + ", " + std::to_string(signal) +
                     ") failed: " + std::strerror(errno));
        }
    }
    return live_.size();
}

std::size_t ProcessTable::terminateAll(std::chrono::milliseconds grace) noexcept {
    close();

    std::size_t terminated = signalAll(SIGTERM);
    if (terminated == 0) {
        return 0;
    }
    LOG_DEBUG("Sent SIGTERM to " + std::to_string(terminated) + " process group(s)");

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (size() == 0) {
            return 0;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    std::size_t killed = signalAll(SIGKILL);
    if (killed > 0) {
        LOG_WARN("Killed " + std::to_string(killed) + " process group(s) after grace period");
    }
    return killed;
}

Process::Process(std::vector<std::string> argv, ProcessTable* table)
    : argv_(std::move(argv)), table_(table) {
}

Process::~Process() {
    closeFds();
    if (registered_ && table_) {
        table_->remove(pid_);
        registered_ = false;
    }
    if (isRunning()) {
        kill(SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        reaped_ = true;
    }
}

void Process::setError(const char* what, int err) {
    error_ = std::string(what) + ": " + std::strerror(err);
}

void Process::closeFds() noexcept {
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

bool Process::spawn() noexcept {
    if (argv_.empty()) {
        error_ = "empty program";
        return false;
    }

    // O_CLOEXEC keeps concurrently spawned siblings from inheriting our pipes
    std::array<int, 2> outPipe{-1, -1};
    std::array<int, 2> errPipe{-1, -1};
    if (::pipe2(outPipe.data(), O_CLOEXEC) != 0) {
        setError("pipe", errno);
        return false;
    }
    if (::pipe2(errPipe.data(), O_CLOEXEC) != 0) {
        setError("pipe", errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return false;
    }

    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;
    posix_spawn_file_actions_init(&actions);
    posix_spawnattr_init(&attr);

    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, outPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, errPipe[1], STDERR_FILENO);

    // Own process group, default signal dispositions, nothing blocked
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGTERM);
    sigaddset(&defaults, SIGPIPE);
    sigset_t mask;
    sigemptyset(&mask);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setsigdefault(&attr, &defaults);
    posix_spawnattr_setsigmask(&attr, &mask);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF |
                                        POSIX_SPAWN_SETSIGMASK);

    std::vector<char*> args;
    args.reserve(argv_.size() + 1);
    for (auto& arg : argv_) {
        args.push_back(arg.data());
    }
    args.push_back(nullptr);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, args[0], &actions, &attr, args.data(), environ);

    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    if (rc != 0) {
        setError(("spawn " + argv_[0]).c_str(), rc);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        return false;
    }

    pid_ = pid;
    stdoutFd_ = outPipe[0];
    stderrFd_ = errPipe[0];

    if (table_) {
        if (!table_->add(pid_)) {
            error_ = "run is shutting down";
            kill(SIGKILL);
            return false;
        }
        registered_ = true;
    }

    LOG_TRACE("Spawned pid " + std::to_string(pid_) + ": " + argv_.back());
    return true;
}

bool Process::drain(const LineHandler& onStderr, std::string& out) noexcept {
    try {
        std::string pending;
        std::array<char, kReadChunk> buffer{};
        bool ok = true;

        while (stdoutFd_ >= 0 || stderrFd_ >= 0) {
            std::array<pollfd, 2> fds = {{
                {stdoutFd_, POLLIN, 0},
                {stderrFd_, POLLIN, 0}
            }};

            // poll() skips negative descriptors
            if (::poll(fds.data(), fds.size(), -1) < 0) {
                if (errno == EINTR) continue;
                setError("poll", errno);
                ok = false;
                break;
            }

            for (std::size_t i = 0; i < fds.size(); ++i) {
                if (fds[i].fd < 0 || fds[i].revents == 0) continue;

                int& fd = (i == 0) ? stdoutFd_ : stderrFd_;
                ssize_t n = ::read(fd, buffer.data(), buffer.size());
                if (n < 0) {
                    if (errno == EINTR || errno == EAGAIN) continue;
                    setError("read", errno);
                    ok = false;
                    closeFd(fd);
                    continue;
                }
                if (n == 0) {
                    closeFd(fd);
                    continue;
                }

                if (i == 0) {
                    out.append(buffer.data(), static_cast<std::size_t>(n));
                } else {
                    pending.append(buffer.data(), static_cast<std::size_t>(n));
                    flushLines(pending, onStderr);
                }
            }
        }

        // Unterminated last line
        if (!pending.empty()) {
            if (pending.back() == '\r') pending.pop_back();
            onStderr(std::move(pending));
        }

        closeFds();
        return ok;
    } catch (const std::exception& e) {
        error_ = std::string("drain: ") + e.what();
        closeFds();
        return false;
    }
}

std::optional<TaskStatus> Process::wait() noexcept {
    if (pid_ <= 0 || reaped_) {
        return std::nullopt;
    }

    // Wait without reaping so the pid cannot be recycled while it is still
    // in the process table.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0) {
        if (errno == EINTR) continue;
        setError("waitid", errno);
        return std::nullopt;
    }

    if (registered_ && table_) {
        table_->remove(pid_);
        registered_ = false;
    }

    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno == EINTR) continue;
        setError("waitpid", errno);
        reaped_ = true;
        return std::nullopt;
    }
    reaped_ = true;

    return classify(status);
}

void Process::kill(int signal) const noexcept {
    if (pid_ > 0 && !reaped_) {
        ::kill(-pid_, signal);
    }
}

TaskStatus Process::classify(int waitStatus) noexcept {
    if (WIFEXITED(waitStatus)) {
        int code = WEXITSTATUS(waitStatus);
        return code == 0 ? TaskStatus::succeeded() : TaskStatus::failed(code);
    }
    return TaskStatus::failed(std::nullopt);
}

}
