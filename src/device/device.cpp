/*
 * device.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device.hpp"

#include <algorithm>
#include <cctype>

namespace wristlink::device {

namespace {

auto toLower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

}  // namespace

auto connectionStateToString(ConnectionState state) -> std::string {
    switch (state) {
        case ConnectionState::Connected:
            return "CONNECTED";
        case ConnectionState::NotConnected:
            return "NOT_CONNECTED";
        case ConnectionState::NotPaired:
            return "NOT_PAIRED";
        case ConnectionState::Unknown:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

auto connectionStateFromString(const std::string& value) -> ConnectionState {
    auto upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (upper == "CONNECTED") {
        return ConnectionState::Connected;
    }
    if (upper == "NOT_CONNECTED") {
        return ConnectionState::NotConnected;
    }
    if (upper == "NOT_PAIRED") {
        return ConnectionState::NotPaired;
    }
    return ConnectionState::Unknown;
}

auto Device::label() const -> std::string {
    if (!displayName.empty()) {
        return displayName;
    }
    return "device-" + std::to_string(id);
}

auto Device::toJson() const -> json {
    json j;
    j["id"] = id;
    j["name"] = displayName;
    j["state"] = connectionStateToString(connectionState);
    return j;
}

auto Device::fromJson(const json& j) -> Device {
    Device dev;
    dev.id = j.value("id", static_cast<DeviceId>(0));
    dev.displayName = j.value("name", "");
    dev.connectionState =
        connectionStateFromString(j.value("state", "CONNECTED"));
    return dev;
}

auto toDeviceSet(const std::vector<Device>& devices) -> DeviceSet {
    DeviceSet set;
    for (const auto& dev : devices) {
        set.insert_or_assign(dev.id, dev);
    }
    return set;
}

auto RealDeviceFilter::isRealDevice(const Device& device) const -> bool {
    if (device.id == simulatorId) {
        return false;
    }
    if (simulatorNamePattern.empty()) {
        return true;
    }
    return toLower(device.displayName).find(toLower(simulatorNamePattern)) ==
           std::string::npos;
}

auto diffDevices(const DeviceSet& previous, const DeviceSet& current)
    -> DeviceDiff {
    DeviceDiff diff;
    for (const auto& [id, dev] : current) {
        if (!previous.contains(id)) {
            diff.added.push_back(dev);
        }
    }
    for (const auto& [id, dev] : previous) {
        if (!current.contains(id)) {
            diff.removed.push_back(dev);
        }
    }
    return diff;
}

}  // namespace wristlink::device
