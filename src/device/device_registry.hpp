/*
 * device_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Tracks real wearables and the listeners registered on them

**************************************************/

#ifndef WRISTLINK_DEVICE_DEVICE_REGISTRY_HPP
#define WRISTLINK_DEVICE_DEVICE_REGISTRY_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <utility>

#include "device.hpp"
#include "sdk/wearable_sdk.hpp"

namespace wristlink::device {

/**
 * @brief Returns the current SDK handle, or nullptr while none exists
 */
using SdkAccessor = std::function<std::shared_ptr<sdk::WearableSdk>()>;

/**
 * @brief Device registry
 *
 * Owns the device and app listener maps. Listener registration is
 * idempotent per device id (device listeners) and per (device id, app id)
 * pair (app listeners). SDK calls are made without holding the registry
 * lock.
 */
class DeviceRegistry {
public:
    DeviceRegistry(SdkAccessor accessor, RealDeviceFilter filter);

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Where device status callbacks are forwarded
     */
    void setStatusForwarder(sdk::DeviceStatusCallback forwarder);

    /**
     * @brief Where app message callbacks are forwarded
     */
    void setMessageForwarder(sdk::AppMessageCallback forwarder);

    [[nodiscard]] auto filter() const -> const RealDeviceFilter& {
        return filter_;
    }

    // ==================== Queries ====================

    /**
     * @brief Connected real devices. Never throws; on SDK failure returns
     * an empty set and records the error (see lastError()).
     */
    auto listConnectedReal() -> DeviceSet;

    /**
     * @brief Known (paired) real devices. Same failure contract as
     * listConnectedReal().
     */
    auto listKnownReal() -> DeviceSet;

    /**
     * @brief Message of the last SDK query failure, if any
     */
    [[nodiscard]] auto lastError() const -> std::optional<std::string>;

    // ==================== Registration ====================

    /**
     * @brief Install a status listener for @p device unless one exists.
     * @return true if a new listener was installed
     */
    auto registerDeviceListener(const Device& device) -> bool;

    /**
     * @brief Install a message listener for (@p device, @p appId) unless
     * one exists.
     * @return true if a new listener was installed
     */
    auto registerAppListener(const Device& device, const std::string& appId)
        -> bool;

    /**
     * @brief Wait @p discoveryDelay, then register device and app listeners
     * for every known real device. Individual failures are logged.
     * @return number of devices with both listeners in place
     */
    auto refreshAndRegister(const std::string& appId,
                            std::chrono::milliseconds discoveryDelay,
                            std::stop_token token = {}) -> std::size_t;

    /**
     * @brief Unregister every listener from the SDK and clear the maps
     */
    void unregisterAll();

    /**
     * @brief Drop all bookkeeping without calling the SDK (handle is gone)
     */
    void forgetAll();

    [[nodiscard]] auto deviceListenerCount() const -> std::size_t;
    [[nodiscard]] auto appListenerCount() const -> std::size_t;
    [[nodiscard]] auto hasDeviceListener(DeviceId id) const -> bool;
    [[nodiscard]] auto hasAppListener(DeviceId id,
                                      const std::string& appId) const -> bool;
    [[nodiscard]] auto empty() const -> bool;

private:
    enum class Query { Known, Connected };
    auto listReal(Query query) -> DeviceSet;

    SdkAccessor accessor_;
    RealDeviceFilter filter_;

    mutable std::mutex mutex_;
    std::map<DeviceId, Device> deviceListeners_;
    std::set<std::pair<DeviceId, std::string>> appListeners_;
    std::optional<std::string> lastError_;
    sdk::DeviceStatusCallback statusForwarder_;
    sdk::AppMessageCallback messageForwarder_;
};

}  // namespace wristlink::device

#endif  // WRISTLINK_DEVICE_DEVICE_REGISTRY_HPP
