/*
 * event_bus.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Process-wide publish-only broadcast bus for relay events

**************************************************/

#ifndef WRISTLINK_EVENTS_EVENT_BUS_HPP
#define WRISTLINK_EVENTS_EVENT_BUS_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "message/events.hpp"

namespace wristlink::events {

using json = nlohmann::json;

using SubscriptionId = std::uint64_t;
using EventCallback = std::function<void(const message::Event&)>;

/**
 * @brief Single-topic broadcast bus.
 *
 * Delivery is at most once per publish, synchronous and without
 * acknowledgement. A subscriber that throws is logged and counted as a
 * delivery error; the remaining subscribers still receive the event.
 */
class BroadcastBus {
public:
    BroadcastBus() = default;

    BroadcastBus(const BroadcastBus&) = delete;
    BroadcastBus& operator=(const BroadcastBus&) = delete;

    /**
     * @brief Receive every event
     */
    auto subscribe(EventCallback callback) -> SubscriptionId;

    /**
     * @brief Receive only events whose type name equals @p type
     */
    auto subscribe(const std::string& type, EventCallback callback)
        -> SubscriptionId;

    void unsubscribe(SubscriptionId id);

    void publish(const message::Event& event);

    [[nodiscard]] auto subscriberCount() const -> std::size_t;
    [[nodiscard]] auto publishedCount() const -> std::uint64_t {
        return publishedCount_.load();
    }
    [[nodiscard]] auto deliveryErrorCount() const -> std::uint64_t {
        return deliveryErrors_.load();
    }

    [[nodiscard]] auto getStatistics() const -> json;

private:
    struct Subscription {
        SubscriptionId id;
        EventCallback callback;
        std::optional<std::string> type;
    };

    mutable std::shared_mutex mutex_;
    std::vector<Subscription> subscriptions_;
    SubscriptionId nextId_{1};

    std::atomic<std::uint64_t> publishedCount_{0};
    std::atomic<std::uint64_t> deliveryErrors_{0};
};

}  // namespace wristlink::events

#endif  // WRISTLINK_EVENTS_EVENT_BUS_HPP
