/*
 * events.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "events.hpp"

#include <spdlog/fmt/fmt.h>

#include "utils/time_utils.hpp"

namespace wristlink::message {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

auto deviceOrUnknown(const std::string& device) -> std::string {
    return device.empty() ? std::string("unknown device") : device;
}

}  // namespace

auto payloadTypeName(const EventPayload& payload) -> std::string {
    return std::visit(
        Overloaded{
            [](const CreatedEvent&) { return std::string("Created"); },
            [](const TerminatedEvent&) { return std::string("Terminated"); },
            [](const ActivityStartedEvent&) {
                return std::string("ActivityStarted");
            },
            [](const ActivityStoppedEvent&) {
                return std::string("ActivityStopped");
            },
            [](const DeviceConnectedEvent&) {
                return std::string("DeviceConnected");
            },
            [](const DeviceDisconnectedEvent&) {
                return std::string("DeviceDisconnected");
            },
            [](const PongEvent&) { return std::string("Pong"); },
        },
        payload);
}

auto Event::toJson() const -> json {
    json j = {{"type", typeName()}, {"receiveTime", receiveTime_}};

    std::visit(Overloaded{
                   [&j](const CreatedEvent& e) {
                       j["startTime"] = e.startTime;
                       j["deviceCount"] = e.deviceCount;
                       j["devices"] = e.devices;
                   },
                   [&j](const TerminatedEvent& e) { j["reason"] = e.reason; },
                   [&j](const ActivityStartedEvent& e) {
                       j["device"] = e.device;
                       j["time"] = e.watchTimeSeconds;
                       j["activity"] = e.activityType;
                   },
                   [&j](const ActivityStoppedEvent& e) {
                       j["device"] = e.device;
                       j["time"] = e.watchTimeSeconds;
                       j["activity"] = e.activityType;
                       j["duration"] = e.durationSeconds;
                   },
                   [&j](const DeviceConnectedEvent& e) {
                       j["device"] = e.device;
                   },
                   [&j](const DeviceDisconnectedEvent& e) {
                       j["device"] = e.device;
                   },
                   [&j](const PongEvent& e) { j["startTime"] = e.startTime; },
               },
               payload_);
    return j;
}

auto Event::toHistoryLine() const -> std::string {
    auto body = std::visit(
        Overloaded{
            [](const CreatedEvent& e) {
                return fmt::format("Listener created ({} device(s))",
                                   e.deviceCount);
            },
            [](const TerminatedEvent& e) {
                return fmt::format("Listener terminated: {}", e.reason);
            },
            [](const ActivityStartedEvent& e) {
                return fmt::format("{}: STARTED {} at {}",
                                   deviceOrUnknown(e.device), e.activityType,
                                   e.watchTimeSeconds);
            },
            [](const ActivityStoppedEvent& e) {
                return fmt::format("{}: STOPPED {} at {} ({}s)",
                                   deviceOrUnknown(e.device), e.activityType,
                                   e.watchTimeSeconds, e.durationSeconds);
            },
            [](const DeviceConnectedEvent& e) {
                return fmt::format("{} connected", e.device);
            },
            [](const DeviceDisconnectedEvent& e) {
                return fmt::format("{} disconnected", e.device);
            },
            [](const PongEvent& e) {
                return fmt::format("Pong (started {})", e.startTime);
            },
        },
        payload_);
    return fmt::format("[{}] {}", utils::formatClockTime(receiveTime_), body);
}

}  // namespace wristlink::message
