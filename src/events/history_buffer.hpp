/*
 * history_buffer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Bounded FIFO of formatted event lines

**************************************************/

#ifndef WRISTLINK_EVENTS_HISTORY_BUFFER_HPP
#define WRISTLINK_EVENTS_HISTORY_BUFFER_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wristlink::events {

/**
 * @brief Fixed-capacity ring of history lines.
 *
 * Appending to a full buffer evicts the oldest line. Reads return copies
 * taken under the lock.
 */
class HistoryBuffer {
public:
    /**
     * @throw atom::error::InvalidArgument if capacity is zero
     */
    explicit HistoryBuffer(std::size_t capacity = 100);

    void append(std::string line);

    /**
     * @brief Lines oldest first
     */
    [[nodiscard]] auto snapshot() const -> std::vector<std::string>;

    /**
     * @brief Lines oldest first, joined with '\n'
     */
    [[nodiscard]] auto joined() const -> std::string;

    [[nodiscard]] auto last() const -> std::optional<std::string>;

    void clear();

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }
    [[nodiscard]] auto empty() const -> bool { return size() == 0; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<std::string> buffer_;
    std::size_t head_{0};
    std::size_t count_{0};
};

}  // namespace wristlink::events

#endif  // WRISTLINK_EVENTS_HISTORY_BUFFER_HPP
