/*
 * event_bus.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "event_bus.hpp"

#include <algorithm>
#include <exception>
#include <mutex>

#include <spdlog/spdlog.h>

namespace wristlink::events {

auto BroadcastBus::subscribe(EventCallback callback) -> SubscriptionId {
    std::unique_lock lock(mutex_);
    SubscriptionId id = nextId_++;
    subscriptions_.push_back(Subscription{id, std::move(callback), std::nullopt});
    return id;
}

auto BroadcastBus::subscribe(const std::string& type, EventCallback callback)
    -> SubscriptionId {
    std::unique_lock lock(mutex_);
    SubscriptionId id = nextId_++;
    subscriptions_.push_back(Subscription{id, std::move(callback), type});
    return id;
}

void BroadcastBus::unsubscribe(SubscriptionId id) {
    std::unique_lock lock(mutex_);
    subscriptions_.erase(
        std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                       [id](const Subscription& sub) { return sub.id == id; }),
        subscriptions_.end());
}

void BroadcastBus::publish(const message::Event& event) {
    const auto type = event.typeName();

    // deliver outside the lock so subscribers may (un)subscribe
    std::vector<EventCallback> targets;
    {
        std::shared_lock lock(mutex_);
        for (const auto& sub : subscriptions_) {
            if (!sub.type || *sub.type == type) {
                targets.push_back(sub.callback);
            }
        }
    }

    publishedCount_++;
    spdlog::debug("[BUS] Publishing {} to {} subscriber(s)", type,
                  targets.size());

    for (const auto& callback : targets) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            deliveryErrors_++;
            spdlog::warn("[BUS] Delivery of {} failed: {}", type, e.what());
        }
    }
}

auto BroadcastBus::subscriberCount() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return subscriptions_.size();
}

auto BroadcastBus::getStatistics() const -> json {
    json stats;
    stats["subscribers"] = subscriberCount();
    stats["published"] = publishedCount_.load();
    stats["deliveryErrors"] = deliveryErrors_.load();
    return stats;
}

}  // namespace wristlink::events
