/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "fanout/types.hpp"

namespace fanout {

using TaskProcessor = std::function<void(TaskId, int workerId)>;

// Fixed set of worker threads. Each thread is one permit: at most
// workerCount() tasks are being processed at any instant, the rest wait in
// the queue.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(TaskProcessor processor);

    // Stops handing out queued tasks without waiting. Tasks already being
    // processed run to completion.
    void requestStop() noexcept;

    // Joins the workers, drops whatever is still queued and releases the
    // processor.
    void stop() noexcept;
    void submit(TaskId taskId) noexcept;
    
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);
    
    int workers_;
    TaskProcessor processor_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    
    mutable std::mutex queueMutex_;
    std::condition_variable taskAvailable_;
    std::queue<TaskId> taskQueue_;
    
    std::vector<std::thread> workerThreads_;
};

}
