/*
 * wearable_sdk.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Abstract seam over the vendor wearable companion SDK

**************************************************/

#ifndef WRISTLINK_SDK_WEARABLE_SDK_HPP
#define WRISTLINK_SDK_WEARABLE_SDK_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "device/device.hpp"
#include "sdk_error.hpp"

namespace wristlink::sdk {

/**
 * @brief Lifecycle callbacks passed to WearableSdk::initialize
 *
 * Invoked on an SDK-owned thread.
 */
struct LifecycleCallbacks {
    std::function<void()> onReady;
    std::function<void(const SdkError&)> onInitializeError;
    std::function<void()> onShutdown;
};

/**
 * @brief Device status callback: the device with its new state
 */
using DeviceStatusCallback = std::function<void(const device::Device&)>;

/**
 * @brief Application message callback: sending device and message objects
 */
using AppMessageCallback = std::function<void(
    const device::Device&, const std::vector<std::string>&)>;

/**
 * @brief One SDK handle.
 *
 * Implementations deliver every callback asynchronously. Device queries on
 * a handle whose binding has been lost throw SdkNotInitializedException;
 * other failures throw SdkOperationException.
 */
class WearableSdk {
public:
    WearableSdk() = default;
    virtual ~WearableSdk() = default;

    // Disable copy
    WearableSdk(const WearableSdk&) = delete;
    WearableSdk& operator=(const WearableSdk&) = delete;

    [[nodiscard]] virtual auto name() const -> std::string = 0;

    // ==================== Lifecycle ====================

    /**
     * @brief Start asynchronous initialization. Exactly one of onReady or
     * onInitializeError follows.
     */
    virtual void initialize(LifecycleCallbacks callbacks) = 0;

    /**
     * @brief Release the handle. Safe to call more than once.
     */
    virtual void shutdown() = 0;

    // ==================== Devices ====================

    virtual auto knownDevices() -> std::vector<device::Device> = 0;
    virtual auto connectedDevices() -> std::vector<device::Device> = 0;

    // ==================== Listeners ====================

    virtual void registerForDeviceEvents(const device::Device& device,
                                         DeviceStatusCallback callback) = 0;
    virtual void unregisterForDeviceEvents(const device::Device& device) = 0;

    virtual void registerForAppEvents(const device::Device& device,
                                      const std::string& appId,
                                      AppMessageCallback callback) = 0;
    virtual void unregisterForAppEvents(const device::Device& device,
                                        const std::string& appId) = 0;
};

/**
 * @brief Creates a fresh SDK handle; called once per (re)initialization
 */
using SdkFactory = std::function<std::shared_ptr<WearableSdk>()>;

}  // namespace wristlink::sdk

#endif  // WRISTLINK_SDK_WEARABLE_SDK_HPP
