/*
 * event_channel.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Blocking multi-producer / single-consumer channel with
             stop_token aware receive

**************************************************/

#ifndef WRISTLINK_UTILS_EVENT_CHANNEL_HPP
#define WRISTLINK_UTILS_EVENT_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace wristlink::utils {

/**
 * @brief FIFO channel used to hand SDK callbacks over to the worker loop.
 *
 * Producers never block. The consumer blocks in receive() until a value is
 * available, the channel is closed, or its stop_token fires, so an idle
 * worker is woken immediately on cancellation instead of polling.
 */
template <typename T>
class EventChannel {
public:
    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /**
     * @brief Enqueue a value.
     * @return false if the channel is closed and the value was dropped
     */
    auto send(T value) -> bool {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Block until a value arrives, the channel closes or a stop is
     * requested.
     * @return the next value, or std::nullopt on close/stop
     */
    auto receive(std::stop_token token) -> std::optional<T> {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, token, [this] { return !queue_.empty() || closed_; });
        return popLocked();
    }

    /**
     * @brief Like receive() but gives up after @p timeout.
     */
    auto receiveFor(std::stop_token token, std::chrono::milliseconds timeout)
        -> std::optional<T> {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, token, timeout,
                     [this] { return !queue_.empty() || closed_; });
        return popLocked();
    }

    [[nodiscard]] auto tryReceive() -> std::optional<T> {
        std::lock_guard lock(mutex_);
        return popLocked();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    void reopen() {
        std::lock_guard lock(mutex_);
        closed_ = false;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        queue_.clear();
    }

    [[nodiscard]] auto isClosed() const -> bool {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    auto popLocked() -> std::optional<T> {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<T> queue_;
    bool closed_{false};
};

}  // namespace wristlink::utils

#endif  // WRISTLINK_UTILS_EVENT_CHANNEL_HPP
