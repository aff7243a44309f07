/*
 * device.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Wearable device model, simulator filter and device-set diff

**************************************************/

#ifndef WRISTLINK_DEVICE_DEVICE_HPP
#define WRISTLINK_DEVICE_DEVICE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wristlink::device {

using json = nlohmann::json;

/**
 * @brief Opaque numeric identifier assigned by the SDK
 */
using DeviceId = std::int64_t;

enum class ConnectionState { Connected, NotConnected, NotPaired, Unknown };

[[nodiscard]] auto connectionStateToString(ConnectionState state)
    -> std::string;
[[nodiscard]] auto connectionStateFromString(const std::string& value)
    -> ConnectionState;

/**
 * @brief A paired wearable. Identity is the id only.
 */
struct Device {
    DeviceId id{0};
    std::string displayName;
    ConnectionState connectionState{ConnectionState::Unknown};

    bool operator==(const Device& other) const { return id == other.id; }

    /**
     * @brief Name for events and notifications, falls back to the id.
     */
    [[nodiscard]] auto label() const -> std::string;

    [[nodiscard]] auto toJson() const -> json;
    static auto fromJson(const json& j) -> Device;
};

/**
 * @brief Devices keyed (and therefore deduplicated) by id
 */
using DeviceSet = std::map<DeviceId, Device>;

[[nodiscard]] auto toDeviceSet(const std::vector<Device>& devices)
    -> DeviceSet;

/**
 * @brief Decides whether a device is a physical wearable.
 *
 * A device is real iff its id differs from the reserved simulator id and
 * its name does not contain the simulator pattern (case-insensitive).
 */
struct RealDeviceFilter {
    DeviceId simulatorId{12345};
    std::string simulatorNamePattern{"simulator"};

    [[nodiscard]] auto isRealDevice(const Device& device) const -> bool;
};

struct DeviceDiff {
    std::vector<Device> added;
    std::vector<Device> removed;

    [[nodiscard]] auto empty() const -> bool {
        return added.empty() && removed.empty();
    }
};

/**
 * @brief Set difference by id. Order follows ascending id.
 */
[[nodiscard]] auto diffDevices(const DeviceSet& previous,
                               const DeviceSet& current) -> DeviceDiff;

}  // namespace wristlink::device

#endif  // WRISTLINK_DEVICE_DEVICE_HPP
