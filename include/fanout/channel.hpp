/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace fanout {

namespace detail {

template <typename T>
struct ChannelState {
    std::mutex mutex;
    std::condition_variable available;
    std::queue<T> items;
    std::size_t senders = 0;
    bool receiverAlive = true;
};

} // namespace detail

template <typename T> class Receiver;

// Producer half of an unbounded multi-producer, single-consumer channel.
// Copies share the channel; it closes once the last copy is destroyed.
template <typename T>
class Sender {
public:
    Sender(const Sender& other) noexcept : state_(other.state_) { attach(); }
    Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

    Sender& operator=(const Sender& other) noexcept {
        if (this != &other) {
            detach();
            state_ = other.state_;
            attach();
        }
        return *this;
    }

    Sender& operator=(Sender&& other) noexcept {
        if (this != &other) {
            detach();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Sender() { detach(); }

    // Returns false when the receiver is gone or this sender was moved from.
    bool send(T value) const {
        if (!state_) return false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->receiverAlive) return false;
            state_->items.push(std::move(value));
        }
        state_->available.notify_one();
        return true;
    }

private:
    template <typename U>
    friend std::pair<Sender<U>, Receiver<U>> makeChannel();

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) noexcept
        : state_(std::move(state)) { attach(); }

    void attach() noexcept {
        if (!state_) return;
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->senders;
    }

    void detach() noexcept {
        if (!state_) return;
        bool closed = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            closed = (--state_->senders == 0);
        }
        if (closed) {
            state_->available.notify_all();
        }
        state_.reset();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

// Consumer half. recv() blocks until an item arrives or every sender is gone.
template <typename T>
class Receiver {
public:
    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;
    Receiver(Receiver&&) noexcept = default;
    Receiver& operator=(Receiver&&) noexcept = default;

    ~Receiver() {
        if (!state_) return;
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->receiverAlive = false;
    }

    // Empty optional means the channel is closed and drained.
    [[nodiscard]] std::optional<T> recv() {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->available.wait(lock, [this] {
            return !state_->items.empty() || state_->senders == 0;
        });
        if (state_->items.empty()) {
            return std::nullopt;
        }
        T value = std::move(state_->items.front());
        state_->items.pop();
        return value;
    }

    [[nodiscard]] std::optional<T> tryRecv() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->items.empty()) {
            return std::nullopt;
        }
        T value = std::move(state_->items.front());
        state_->items.pop();
        return value;
    }

    [[nodiscard]] bool isClosed() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->senders == 0 && state_->items.empty();
    }

private:
    template <typename U>
    friend std::pair<Sender<U>, Receiver<U>> makeChannel();

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) noexcept
        : state_(std::move(state)) {}

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel() {
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace fanout
