/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/pool.hpp"
#include "fanout/logger.hpp"

namespace fanout {

Pool::Pool(int workers) noexcept : workers_(workers < 1 ? 1 : workers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(TaskProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid task processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        
        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::requestStop() noexcept {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
    }
    taskAvailable_.notify_all();
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    
    requestStop();
    running_.store(false);
    
    // Wait for all threads to finish
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    
    workerThreads_.clear();
    
    // Clear remaining tasks
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = taskQueue_.size();
        while (!taskQueue_.empty()) {
            taskQueue_.pop();
        }
    }
    if (dropped > 0) {
        LOG_INFO("Pool dropped " + std::to_string(dropped) + " queued task(s)");
    }

    // Captured state (event senders) must not outlive the workers
    processor_ = nullptr;
    
    LOG_DEBUG("Pool stopped");
}

void Pool::submit(TaskId taskId) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit task to stopped pool: " + std::to_string(taskId));
        return;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            taskQueue_.push(taskId);
        }
        
        taskAvailable_.notify_one();
        LOG_TRACE("Task queued: " + std::to_string(taskId));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue task " + std::to_string(taskId) + ": " + e.what());
    }
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return taskQueue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_TRACE("Worker-" + std::to_string(workerId) + " thread started");
    
    while (!shutdown_.load()) {
        TaskId taskId = 0;
        
        // Get next task
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            
            // Wait for task or shutdown signal
            taskAvailable_.wait(lock, [this] { 
                return !taskQueue_.empty() || shutdown_.load(); 
            });
            
            if (shutdown_.load()) {
                break;
            }
            
            taskId = taskQueue_.front();
            taskQueue_.pop();
        }
        
        // Process task outside of lock
        LOG_DEBUG("Worker-" + std::to_string(workerId) + " claimed task: " + std::to_string(taskId));
        try {
            processor_(taskId, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " task processing error: " + 
                     std::string(e.what()) + " (task: " + std::to_string(taskId) + ")");
        }
    }
    
    LOG_TRACE("Worker " + std::to_string(workerId) + " stopped");
}

}
