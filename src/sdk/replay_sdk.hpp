/*
 * replay_sdk.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Scripted WearableSdk backend driven by a JSON scenario

**************************************************/

#ifndef WRISTLINK_SDK_REPLAY_SDK_HPP
#define WRISTLINK_SDK_REPLAY_SDK_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "wearable_sdk.hpp"

namespace wristlink::sdk {

using json = nlohmann::json;

enum class ReplayStepType { Message, Status, BindingLost, InitError };

[[nodiscard]] auto replayStepTypeToString(ReplayStepType type) -> std::string;

/**
 * @brief One timed step of a scenario
 */
struct ReplayStep {
    ReplayStepType type{ReplayStepType::Message};
    std::chrono::milliseconds delay{0};
    device::DeviceId deviceId{0};
    std::vector<std::string> parts;      // message
    device::ConnectionState state{device::ConnectionState::Connected};  // status
    std::string message;                 // initError

    [[nodiscard]] auto toJson() const -> json;
    static auto fromJson(const json& j) -> ReplayStep;
};

/**
 * @brief Scenario shared by every handle the replay factory creates.
 *
 * The step cursor lives here, so a handle created by recovery continues
 * after the step that broke the previous one.
 */
class ReplayScenario {
public:
    ReplayScenario() = default;
    ReplayScenario(std::vector<device::Device> devices,
                   std::vector<ReplayStep> steps,
                   std::chrono::milliseconds readyDelay = std::chrono::milliseconds(100));

    static auto fromJson(const json& j) -> std::shared_ptr<ReplayScenario>;

    /**
     * @brief Load a scenario file.
     * @throw SdkOperationException if the file is missing or malformed
     */
    static auto loadFile(const std::string& path)
        -> std::shared_ptr<ReplayScenario>;

    [[nodiscard]] auto readyDelay() const -> std::chrono::milliseconds {
        return readyDelay_;
    }

    [[nodiscard]] auto devices() const -> std::vector<device::Device>;
    [[nodiscard]] auto findDevice(device::DeviceId id) const
        -> std::optional<device::Device>;
    auto setDeviceState(device::DeviceId id, device::ConnectionState state)
        -> std::optional<device::Device>;

    /**
     * @brief Take the next step and advance the cursor
     */
    auto nextStep() -> std::optional<ReplayStep>;
    [[nodiscard]] auto remainingSteps() const -> std::size_t;

    /**
     * @brief Arm a failure for the next initialize()
     */
    void failNextInit(std::string message);
    auto takeInitFailure() -> std::optional<std::string>;

private:
    mutable std::mutex mutex_;
    std::vector<device::Device> devices_;
    std::vector<ReplayStep> steps_;
    std::size_t cursor_{0};
    std::chrono::milliseconds readyDelay_{100};
    std::optional<std::string> pendingInitFailure_;
};

/**
 * @brief WearableSdk that plays a ReplayScenario on its own thread
 *
 * A bindingLost step marks the handle stale, reports the step's device as
 * connected and ends this handle's replay.
 */
class ReplaySdk : public WearableSdk {
public:
    explicit ReplaySdk(std::shared_ptr<ReplayScenario> scenario);
    ~ReplaySdk() override;

    [[nodiscard]] auto name() const -> std::string override {
        return "replay";
    }

    void initialize(LifecycleCallbacks callbacks) override;
    void shutdown() override;

    auto knownDevices() -> std::vector<device::Device> override;
    auto connectedDevices() -> std::vector<device::Device> override;

    void registerForDeviceEvents(const device::Device& device,
                                 DeviceStatusCallback callback) override;
    void unregisterForDeviceEvents(const device::Device& device) override;
    void registerForAppEvents(const device::Device& device,
                              const std::string& appId,
                              AppMessageCallback callback) override;
    void unregisterForAppEvents(const device::Device& device,
                                const std::string& appId) override;

    [[nodiscard]] auto isBindingLost() const -> bool {
        return bindingLost_.load();
    }

private:
    void run(std::stop_token token, LifecycleCallbacks callbacks);
    void apply(const ReplayStep& step);
    void ensureBound(const char* operation) const;

    std::shared_ptr<ReplayScenario> scenario_;
    std::atomic<bool> bindingLost_{false};
    std::atomic<bool> shutDown_{false};

    std::mutex mutex_;
    std::map<device::DeviceId, DeviceStatusCallback> deviceListeners_;
    std::map<std::pair<device::DeviceId, std::string>, AppMessageCallback>
        appListeners_;

    std::mutex threadMutex_;
    std::jthread thread_;
};

/**
 * @brief Factory producing ReplaySdk handles over one shared scenario
 */
[[nodiscard]] auto makeReplayFactory(std::shared_ptr<ReplayScenario> scenario)
    -> SdkFactory;

}  // namespace wristlink::sdk

#endif  // WRISTLINK_SDK_REPLAY_SDK_HPP
