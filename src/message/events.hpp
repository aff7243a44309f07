/*
 * events.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Relay event model published on the broadcast bus

**************************************************/

#ifndef WRISTLINK_MESSAGE_EVENTS_HPP
#define WRISTLINK_MESSAGE_EVENTS_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace wristlink::message {

using json = nlohmann::json;

/**
 * @brief A listener session came up.
 */
struct CreatedEvent {
    std::int64_t startTime{0};  ///< ms since epoch
    int deviceCount{0};
    std::vector<std::string> devices;

    bool operator==(const CreatedEvent&) const = default;
};

/**
 * @brief A listener session ended. Always the last event of a session.
 */
struct TerminatedEvent {
    std::string reason;

    bool operator==(const TerminatedEvent&) const = default;
};

struct ActivityStartedEvent {
    std::string device;
    std::int64_t watchTimeSeconds{0};
    std::string activityType;

    bool operator==(const ActivityStartedEvent&) const = default;
};

struct ActivityStoppedEvent {
    std::string device;
    std::int64_t watchTimeSeconds{0};
    std::string activityType;
    std::int64_t durationSeconds{0};

    bool operator==(const ActivityStoppedEvent&) const = default;
};

struct DeviceConnectedEvent {
    std::string device;

    bool operator==(const DeviceConnectedEvent&) const = default;
};

struct DeviceDisconnectedEvent {
    std::string device;

    bool operator==(const DeviceDisconnectedEvent&) const = default;
};

/**
 * @brief Reply to a Ping command. startTime is the running session's start
 * time in ms, or 0 if no session is running.
 */
struct PongEvent {
    std::int64_t startTime{0};

    bool operator==(const PongEvent&) const = default;
};

using EventPayload =
    std::variant<CreatedEvent, TerminatedEvent, ActivityStartedEvent,
                 ActivityStoppedEvent, DeviceConnectedEvent,
                 DeviceDisconnectedEvent, PongEvent>;

/**
 * @brief Discriminant string of a payload ("Created", "ActivityStarted", ...)
 */
[[nodiscard]] auto payloadTypeName(const EventPayload& payload) -> std::string;

/**
 * @brief Immutable event: a payload stamped with the relay's receive time.
 *
 * receiveTime is milliseconds since epoch; the watch-originated `time` field
 * of activity payloads is seconds since epoch.
 */
class Event {
public:
    Event(EventPayload payload, std::int64_t receiveTime)
        : payload_(std::move(payload)), receiveTime_(receiveTime) {}

    [[nodiscard]] auto payload() const -> const EventPayload& {
        return payload_;
    }
    [[nodiscard]] auto receiveTime() const -> std::int64_t {
        return receiveTime_;
    }
    [[nodiscard]] auto typeName() const -> std::string {
        return payloadTypeName(payload_);
    }

    template <typename T>
    [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(payload_);
    }

    template <typename T>
    [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(payload_);
    }

    /**
     * @brief Wire form for the broadcast bus.
     */
    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief One line for the history buffer, prefixed with the local
     * receive clock time.
     */
    [[nodiscard]] auto toHistoryLine() const -> std::string;

    bool operator==(const Event&) const = default;

private:
    EventPayload payload_;
    std::int64_t receiveTime_;
};

}  // namespace wristlink::message

#endif  // WRISTLINK_MESSAGE_EVENTS_HPP
