/*
 * event_dispatcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Turns raw app messages and device changes into published
             events, history lines and notification updates

**************************************************/

#ifndef WRISTLINK_EVENTS_EVENT_DISPATCHER_HPP
#define WRISTLINK_EVENTS_EVENT_DISPATCHER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "device/device.hpp"
#include "event_bus.hpp"
#include "history_buffer.hpp"
#include "message/events.hpp"
#include "notification.hpp"
#include "utils/time_utils.hpp"

namespace wristlink::events {

class EventDispatcher {
public:
    EventDispatcher(BroadcastBus& bus,
                    std::shared_ptr<NotificationSink> notifications,
                    std::size_t historyCapacity = 100,
                    utils::Clock clock = utils::nowMillis);

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /**
     * @brief Parse and publish one app message.
     *
     * Parse failures are logged and dropped.
     * @return true if an event was published
     */
    auto onMessage(std::string_view raw, const std::string& deviceName,
                   std::int64_t receiveTime) -> bool;

    /**
     * @brief Publish DeviceConnected / DeviceDisconnected for each change
     */
    void onDeviceChange(const std::vector<device::Device>& added,
                        const std::vector<device::Device>& removed);

    /**
     * @brief Replace the connected-device list without publishing anything
     */
    void resetDevices(const device::DeviceSet& connected);

    /**
     * @brief Stamp @p payload with the current time and publish it.
     *
     * Every event except Pong is also written to the history.
     */
    auto publish(message::EventPayload payload) -> message::Event;

    /**
     * @brief Publish an already stamped event
     */
    void publish(const message::Event& event);

    /**
     * @brief History snapshot, newline joined
     */
    [[nodiscard]] auto history() const -> std::string;
    [[nodiscard]] auto historyLines() const -> std::vector<std::string>;
    void clearHistory();

    /**
     * @brief Switch the notification to the stopped text
     */
    void markStopped();

    [[nodiscard]] auto connectedDevices() const -> std::vector<std::string>;
    [[nodiscard]] auto lastMessage() const -> std::optional<std::string>;
    [[nodiscard]] auto droppedCount() const -> std::uint64_t;
    [[nodiscard]] auto now() const -> std::int64_t { return clock_(); }

private:
    void refreshNotification();

    BroadcastBus& bus_;
    std::shared_ptr<NotificationSink> notifications_;
    utils::Clock clock_;
    HistoryBuffer history_;

    mutable std::mutex mutex_;
    std::map<device::DeviceId, std::string> connected_;
    std::optional<std::string> lastMessage_;
    bool stopped_{false};
    std::uint64_t dropped_{0};
};

}  // namespace wristlink::events

#endif  // WRISTLINK_EVENTS_EVENT_DISPATCHER_HPP
