/*
 * event_dispatcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "event_dispatcher.hpp"

#include <exception>
#include <type_traits>
#include <variant>

#include <spdlog/spdlog.h>

#include "message/message_parser.hpp"

namespace wristlink::events {

EventDispatcher::EventDispatcher(BroadcastBus& bus,
                                 std::shared_ptr<NotificationSink> notifications,
                                 std::size_t historyCapacity,
                                 utils::Clock clock)
    : bus_(bus),
      notifications_(std::move(notifications)),
      clock_(clock ? std::move(clock) : utils::Clock(utils::nowMillis)),
      history_(historyCapacity) {}

auto EventDispatcher::onMessage(std::string_view raw,
                                const std::string& deviceName,
                                std::int64_t receiveTime) -> bool {
    auto parsed = message::parseMessage(raw);
    if (!parsed) {
        spdlog::warn("[RX] Dropping message '{}' from {}: {}", raw, deviceName,
                     parsed.error().toString());
        std::lock_guard lock(mutex_);
        ++dropped_;
        return false;
    }

    auto payload = std::move(*parsed);
    std::visit(
        [&deviceName](auto& activity) {
            using T = std::decay_t<decltype(activity)>;
            if constexpr (std::is_same_v<T, message::ActivityStartedEvent> ||
                          std::is_same_v<T, message::ActivityStoppedEvent>) {
                activity.device = deviceName;
            }
        },
        payload);

    message::Event event(std::move(payload), receiveTime);
    auto line = event.toHistoryLine();
    history_.append(line);
    {
        std::lock_guard lock(mutex_);
        lastMessage_ = line;
    }
    spdlog::info("[RX] {}", line);

    bus_.publish(event);
    refreshNotification();
    return true;
}

void EventDispatcher::onDeviceChange(const std::vector<device::Device>& added,
                                     const std::vector<device::Device>& removed) {
    {
        std::lock_guard lock(mutex_);
        for (const auto& dev : added) {
            connected_[dev.id] = dev.label();
        }
        for (const auto& dev : removed) {
            connected_.erase(dev.id);
        }
    }

    for (const auto& dev : added) {
        spdlog::info("[DEVICE-EVENT] {} connected", dev.label());
        publish(message::DeviceConnectedEvent{dev.label()});
    }
    for (const auto& dev : removed) {
        spdlog::info("[DEVICE-EVENT] {} disconnected", dev.label());
        publish(message::DeviceDisconnectedEvent{dev.label()});
    }
    if (added.empty() && removed.empty()) {
        refreshNotification();
    }
}

void EventDispatcher::resetDevices(const device::DeviceSet& connected) {
    {
        std::lock_guard lock(mutex_);
        connected_.clear();
        for (const auto& [id, dev] : connected) {
            connected_[id] = dev.label();
        }
        stopped_ = false;
    }
    refreshNotification();
}

auto EventDispatcher::publish(message::EventPayload payload) -> message::Event {
    message::Event event(std::move(payload), clock_());
    publish(event);
    return event;
}

void EventDispatcher::publish(const message::Event& event) {
    if (!event.is<message::PongEvent>()) {
        history_.append(event.toHistoryLine());
    }
    bus_.publish(event);
    refreshNotification();
}

auto EventDispatcher::history() const -> std::string {
    return history_.joined();
}

auto EventDispatcher::historyLines() const -> std::vector<std::string> {
    return history_.snapshot();
}

void EventDispatcher::clearHistory() {
    history_.clear();
    std::lock_guard lock(mutex_);
    lastMessage_.reset();
}

void EventDispatcher::markStopped() {
    {
        std::lock_guard lock(mutex_);
        stopped_ = true;
        connected_.clear();
    }
    refreshNotification();
}

auto EventDispatcher::connectedDevices() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    names.reserve(connected_.size());
    for (const auto& [id, name] : connected_) {
        names.push_back(name);
    }
    return names;
}

auto EventDispatcher::lastMessage() const -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    return lastMessage_;
}

auto EventDispatcher::droppedCount() const -> std::uint64_t {
    std::lock_guard lock(mutex_);
    return dropped_;
}

void EventDispatcher::refreshNotification() {
    if (!notifications_) {
        return;
    }
    Notification notification;
    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [id, name] : connected_) {
            names.push_back(name);
        }
        notification = formatNotification(names, lastMessage_, stopped_);
    }
    try {
        notifications_->update(notification);
    } catch (const std::exception& e) {
        spdlog::warn("[NOTIFY] Notification update failed: {}", e.what());
    }
}

}  // namespace wristlink::events
