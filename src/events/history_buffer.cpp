/*
 * history_buffer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "history_buffer.hpp"

#include "atom/error/exception.hpp"

namespace wristlink::events {

HistoryBuffer::HistoryBuffer(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        THROW_INVALID_ARGUMENT("history capacity must be positive");
    }
    buffer_.resize(capacity_);
}

void HistoryBuffer::append(std::string line) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_[head_] = std::move(line);
    head_ = (head_ + 1) % capacity_;
    if (count_ < capacity_) {
        ++count_;
    }
}

auto HistoryBuffer::snapshot() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(count_);

    size_t start = (head_ + capacity_ - count_) % capacity_;
    for (size_t i = 0; i < count_; ++i) {
        result.push_back(buffer_[(start + i) % capacity_]);
    }
    return result;
}

auto HistoryBuffer::joined() const -> std::string {
    auto lines = snapshot();
    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += lines[i];
    }
    return text;
}

auto HistoryBuffer::last() const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ == 0) {
        return std::nullopt;
    }
    return buffer_[(head_ + capacity_ - 1) % capacity_];
}

void HistoryBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& line : buffer_) {
        line.clear();
    }
    head_ = 0;
    count_ = 0;
}

auto HistoryBuffer::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

}  // namespace wristlink::events
