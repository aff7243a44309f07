/*
 * device_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_registry.hpp"

#include <exception>
#include <vector>

#include <spdlog/spdlog.h>

#include "sdk/sdk_exceptions.hpp"
#include "utils/time_utils.hpp"

namespace wristlink::device {

DeviceRegistry::DeviceRegistry(SdkAccessor accessor, RealDeviceFilter filter)
    : accessor_(std::move(accessor)), filter_(std::move(filter)) {}

void DeviceRegistry::setStatusForwarder(sdk::DeviceStatusCallback forwarder) {
    std::lock_guard lock(mutex_);
    statusForwarder_ = std::move(forwarder);
}

void DeviceRegistry::setMessageForwarder(sdk::AppMessageCallback forwarder) {
    std::lock_guard lock(mutex_);
    messageForwarder_ = std::move(forwarder);
}

auto DeviceRegistry::listConnectedReal() -> DeviceSet {
    return listReal(Query::Connected);
}

auto DeviceRegistry::listKnownReal() -> DeviceSet {
    return listReal(Query::Known);
}

auto DeviceRegistry::listReal(Query query) -> DeviceSet {
    const char* what = query == Query::Known ? "known" : "connected";
    auto sdk = accessor_();
    if (!sdk) {
        spdlog::warn("[DEVICES] No SDK handle, cannot list {} devices", what);
        std::lock_guard lock(mutex_);
        lastError_ = "no SDK handle";
        return {};
    }

    std::vector<Device> devices;
    try {
        devices = query == Query::Known ? sdk->knownDevices()
                                        : sdk->connectedDevices();
    } catch (const std::exception& e) {
        spdlog::error("[DEVICES] Failed to list {} devices: {}", what,
                      e.what());
        std::lock_guard lock(mutex_);
        lastError_ = e.what();
        return {};
    }

    DeviceSet result;
    for (const auto& dev : devices) {
        if (!filter_.isRealDevice(dev)) {
            spdlog::debug("[DEVICES] Skipping simulator {} ({})", dev.label(),
                          dev.id);
            continue;
        }
        result.insert_or_assign(dev.id, dev);
    }
    spdlog::debug("[DEVICES] {} {} real device(s)", result.size(), what);

    std::lock_guard lock(mutex_);
    lastError_.reset();
    return result;
}

auto DeviceRegistry::lastError() const -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    return lastError_;
}

auto DeviceRegistry::registerDeviceListener(const Device& device) -> bool {
    sdk::DeviceStatusCallback forwarder;
    {
        std::lock_guard lock(mutex_);
        if (deviceListeners_.contains(device.id)) {
            return false;
        }
        // claim the slot so a concurrent caller sees it as registered
        deviceListeners_.emplace(device.id, device);
        forwarder = statusForwarder_;
    }

    auto sdk = accessor_();
    try {
        if (!sdk) {
            THROW_SDK_OPERATION_ERROR("no SDK handle");
        }
        sdk->registerForDeviceEvents(
            device, [forwarder](const Device& changed) {
                if (forwarder) {
                    forwarder(changed);
                }
            });
    } catch (const std::exception& e) {
        spdlog::error("[DEVICES] Failed to register device listener for {}: {}",
                      device.label(), e.what());
        std::lock_guard lock(mutex_);
        deviceListeners_.erase(device.id);
        return false;
    }

    spdlog::info("[DEVICES] Registered device listener for {} ({})",
                 device.label(), device.id);
    return true;
}

auto DeviceRegistry::registerAppListener(const Device& device,
                                         const std::string& appId) -> bool {
    auto key = std::make_pair(device.id, appId);
    sdk::AppMessageCallback forwarder;
    {
        std::lock_guard lock(mutex_);
        if (appListeners_.contains(key)) {
            return false;
        }
        appListeners_.insert(key);
        forwarder = messageForwarder_;
    }

    auto sdk = accessor_();
    try {
        if (!sdk) {
            THROW_SDK_OPERATION_ERROR("no SDK handle");
        }
        sdk->registerForAppEvents(
            device, appId,
            [forwarder](const Device& from,
                        const std::vector<std::string>& parts) {
                if (forwarder) {
                    forwarder(from, parts);
                }
            });
    } catch (const std::exception& e) {
        spdlog::error("[APP] Failed to register app listener for {}: {}",
                      device.label(), e.what());
        std::lock_guard lock(mutex_);
        appListeners_.erase(key);
        return false;
    }

    spdlog::info("[APP] Registered app listener for {} ({})", device.label(),
                 appId);
    return true;
}

auto DeviceRegistry::refreshAndRegister(const std::string& appId,
                                        std::chrono::milliseconds discoveryDelay,
                                        std::stop_token token) -> std::size_t {
    if (!utils::interruptibleSleep(token, discoveryDelay)) {
        return 0;
    }

    auto known = listKnownReal();
    spdlog::info("[DEVICES] Found {} known real device(s)", known.size());

    std::size_t ready = 0;
    for (const auto& [id, dev] : known) {
        registerDeviceListener(dev);
        registerAppListener(dev, appId);
        if (hasDeviceListener(id) && hasAppListener(id, appId)) {
            ++ready;
        }
    }
    return ready;
}

void DeviceRegistry::unregisterAll() {
    std::map<DeviceId, Device> devices;
    std::set<std::pair<DeviceId, std::string>> apps;
    {
        std::lock_guard lock(mutex_);
        devices.swap(deviceListeners_);
        apps.swap(appListeners_);
    }
    if (devices.empty() && apps.empty()) {
        return;
    }

    auto sdk = accessor_();
    if (!sdk) {
        spdlog::debug("[DEVICES] No SDK handle, dropped {} listener(s)",
                      devices.size() + apps.size());
        return;
    }

    for (const auto& [id, appId] : apps) {
        Device dev;
        dev.id = id;
        if (auto it = devices.find(id); it != devices.end()) {
            dev = it->second;
        }
        try {
            sdk->unregisterForAppEvents(dev, appId);
        } catch (const std::exception& e) {
            spdlog::warn("[APP] Failed to unregister app listener for {}: {}",
                         dev.label(), e.what());
        }
    }
    for (const auto& [id, dev] : devices) {
        try {
            sdk->unregisterForDeviceEvents(dev);
        } catch (const std::exception& e) {
            spdlog::warn("[DEVICES] Failed to unregister device listener for {}: {}",
                         dev.label(), e.what());
        }
    }
    spdlog::info("[DEVICES] Unregistered {} device and {} app listener(s)",
                 devices.size(), apps.size());
}

void DeviceRegistry::forgetAll() {
    std::lock_guard lock(mutex_);
    deviceListeners_.clear();
    appListeners_.clear();
    lastError_.reset();
}

auto DeviceRegistry::deviceListenerCount() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return deviceListeners_.size();
}

auto DeviceRegistry::appListenerCount() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return appListeners_.size();
}

auto DeviceRegistry::hasDeviceListener(DeviceId id) const -> bool {
    std::lock_guard lock(mutex_);
    return deviceListeners_.contains(id);
}

auto DeviceRegistry::hasAppListener(DeviceId id,
                                    const std::string& appId) const -> bool {
    std::lock_guard lock(mutex_);
    return appListeners_.contains(std::make_pair(id, appId));
}

auto DeviceRegistry::empty() const -> bool {
    std::lock_guard lock(mutex_);
    return deviceListeners_.empty() && appListeners_.empty();
}

}  // namespace wristlink::device
