/*
 * replay_sdk.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "replay_sdk.hpp"

#include <exception>
#include <fstream>

#include <spdlog/spdlog.h>

#include "sdk_exceptions.hpp"
#include "utils/time_utils.hpp"

namespace wristlink::sdk {

auto replayStepTypeToString(ReplayStepType type) -> std::string {
    switch (type) {
        case ReplayStepType::Message:
            return "message";
        case ReplayStepType::Status:
            return "status";
        case ReplayStepType::BindingLost:
            return "bindingLost";
        case ReplayStepType::InitError:
            return "initError";
    }
    return "unknown";
}

namespace {

auto replayStepTypeFromString(const std::string& value) -> ReplayStepType {
    if (value == "message") {
        return ReplayStepType::Message;
    }
    if (value == "status") {
        return ReplayStepType::Status;
    }
    if (value == "bindingLost") {
        return ReplayStepType::BindingLost;
    }
    if (value == "initError") {
        return ReplayStepType::InitError;
    }
    THROW_SDK_OPERATION_ERROR("unknown replay step type '", value, "'");
}

}  // namespace

// ==================== ReplayStep ====================

auto ReplayStep::toJson() const -> json {
    json j;
    j["type"] = replayStepTypeToString(type);
    j["delayMs"] = delay.count();
    j["device"] = deviceId;
    switch (type) {
        case ReplayStepType::Message:
            j["parts"] = parts;
            break;
        case ReplayStepType::Status:
            j["state"] = device::connectionStateToString(state);
            break;
        case ReplayStepType::InitError:
            j["message"] = message;
            break;
        case ReplayStepType::BindingLost:
            break;
    }
    return j;
}

auto ReplayStep::fromJson(const json& j) -> ReplayStep {
    ReplayStep step;
    step.type = replayStepTypeFromString(j.value("type", "message"));
    step.delay = std::chrono::milliseconds(j.value("delayMs", 0));
    step.deviceId = j.value("device", static_cast<device::DeviceId>(0));
    if (j.contains("parts")) {
        step.parts = j["parts"].get<std::vector<std::string>>();
    } else if (j.contains("payload")) {
        step.parts = {j["payload"].get<std::string>()};
    }
    step.state = device::connectionStateFromString(j.value("state", "CONNECTED"));
    step.message = j.value("message", "replayed initialization error");
    return step;
}

// ==================== ReplayScenario ====================

ReplayScenario::ReplayScenario(std::vector<device::Device> devices,
                               std::vector<ReplayStep> steps,
                               std::chrono::milliseconds readyDelay)
    : devices_(std::move(devices)),
      steps_(std::move(steps)),
      readyDelay_(readyDelay) {}

auto ReplayScenario::fromJson(const json& j)
    -> std::shared_ptr<ReplayScenario> {
    std::vector<device::Device> devices;
    for (const auto& dev : j.value("devices", json::array())) {
        devices.push_back(device::Device::fromJson(dev));
    }
    std::vector<ReplayStep> steps;
    for (const auto& step : j.value("steps", json::array())) {
        steps.push_back(ReplayStep::fromJson(step));
    }
    auto scenario = std::make_shared<ReplayScenario>(
        std::move(devices), std::move(steps),
        std::chrono::milliseconds(j.value("readyDelayMs", 100)));
    if (j.value("initError", false)) {
        scenario->failNextInit(
            j.value("initErrorMessage", "replayed initialization error"));
    }
    return scenario;
}

auto ReplayScenario::loadFile(const std::string& path)
    -> std::shared_ptr<ReplayScenario> {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_SDK_OPERATION_ERROR("cannot open replay scenario ", path);
    }
    try {
        auto scenario = fromJson(json::parse(file));
        spdlog::info("[INIT] Loaded replay scenario {} ({} step(s))", path,
                     scenario->remainingSteps());
        return scenario;
    } catch (const json::exception& e) {
        THROW_SDK_OPERATION_ERROR("invalid replay scenario ", path, ": ",
                                  e.what());
    }
}

auto ReplayScenario::devices() const -> std::vector<device::Device> {
    std::lock_guard lock(mutex_);
    return devices_;
}

auto ReplayScenario::findDevice(device::DeviceId id) const
    -> std::optional<device::Device> {
    std::lock_guard lock(mutex_);
    for (const auto& dev : devices_) {
        if (dev.id == id) {
            return dev;
        }
    }
    return std::nullopt;
}

auto ReplayScenario::setDeviceState(device::DeviceId id,
                                    device::ConnectionState state)
    -> std::optional<device::Device> {
    std::lock_guard lock(mutex_);
    for (auto& dev : devices_) {
        if (dev.id == id) {
            dev.connectionState = state;
            return dev;
        }
    }
    return std::nullopt;
}

auto ReplayScenario::nextStep() -> std::optional<ReplayStep> {
    std::lock_guard lock(mutex_);
    if (cursor_ >= steps_.size()) {
        return std::nullopt;
    }
    return steps_[cursor_++];
}

auto ReplayScenario::remainingSteps() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return steps_.size() - cursor_;
}

void ReplayScenario::failNextInit(std::string message) {
    std::lock_guard lock(mutex_);
    pendingInitFailure_ = std::move(message);
}

auto ReplayScenario::takeInitFailure() -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    auto failure = std::move(pendingInitFailure_);
    pendingInitFailure_.reset();
    return failure;
}

// ==================== ReplaySdk ====================

ReplaySdk::ReplaySdk(std::shared_ptr<ReplayScenario> scenario)
    : scenario_(std::move(scenario)) {
    if (!scenario_) {
        scenario_ = std::make_shared<ReplayScenario>();
    }
}

ReplaySdk::~ReplaySdk() { shutdown(); }

void ReplaySdk::initialize(LifecycleCallbacks callbacks) {
    if (shutDown_.load()) {
        THROW_SDK_OPERATION_ERROR("replay handle already shut down");
    }
    std::lock_guard lock(threadMutex_);
    if (thread_.joinable()) {
        THROW_SDK_OPERATION_ERROR("replay handle already initialized");
    }
    thread_ = std::jthread([this, callbacks = std::move(callbacks)](
                               std::stop_token token) { run(token, callbacks); });
}

void ReplaySdk::run(std::stop_token token, LifecycleCallbacks callbacks) {
    if (!utils::interruptibleSleep(token, scenario_->readyDelay())) {
        return;
    }

    if (auto failure = scenario_->takeInitFailure()) {
        if (callbacks.onInitializeError) {
            callbacks.onInitializeError(
                SdkError(SdkErrorCode::InitError, *failure));
        }
        return;
    }
    if (callbacks.onReady) {
        callbacks.onReady();
    }

    while (!token.stop_requested()) {
        auto step = scenario_->nextStep();
        if (!step) {
            break;
        }
        if (!utils::interruptibleSleep(token, step->delay)) {
            return;
        }
        spdlog::debug("[INIT] Replaying {} step", replayStepTypeToString(step->type));
        try {
            apply(*step);
        } catch (const std::exception& e) {
            spdlog::error("[INIT] Replay step {} failed: {}",
                          replayStepTypeToString(step->type), e.what());
        }
        if (bindingLost_.load()) {
            // remaining steps belong to the handle created by recovery
            return;
        }
    }
}

void ReplaySdk::apply(const ReplayStep& step) {
    switch (step.type) {
        case ReplayStepType::Message: {
            auto dev = scenario_->findDevice(step.deviceId);
            if (!dev) {
                spdlog::warn("[INIT] Replay message for unknown device {}",
                             step.deviceId);
                return;
            }
            std::vector<AppMessageCallback> targets;
            {
                std::lock_guard lock(mutex_);
                for (const auto& [key, callback] : appListeners_) {
                    if (key.first == step.deviceId) {
                        targets.push_back(callback);
                    }
                }
            }
            for (const auto& callback : targets) {
                callback(*dev, step.parts);
            }
            break;
        }
        case ReplayStepType::Status: {
            auto dev = scenario_->setDeviceState(step.deviceId, step.state);
            if (!dev) {
                spdlog::warn("[INIT] Replay status for unknown device {}",
                             step.deviceId);
                return;
            }
            DeviceStatusCallback callback;
            {
                std::lock_guard lock(mutex_);
                if (auto it = deviceListeners_.find(step.deviceId);
                    it != deviceListeners_.end()) {
                    callback = it->second;
                }
            }
            if (callback) {
                callback(*dev);
            }
            break;
        }
        case ReplayStepType::BindingLost: {
            bindingLost_.store(true);
            // the platform still reports the device coming back; only the
            // next query reveals the stale binding
            auto dev = scenario_->findDevice(step.deviceId);
            DeviceStatusCallback callback;
            {
                std::lock_guard lock(mutex_);
                if (auto it = deviceListeners_.find(step.deviceId);
                    it != deviceListeners_.end()) {
                    callback = it->second;
                }
            }
            if (dev && callback) {
                auto reported = *dev;
                reported.connectionState = device::ConnectionState::Connected;
                callback(reported);
            }
            break;
        }
        case ReplayStepType::InitError:
            scenario_->failNextInit(step.message);
            break;
    }
}

void ReplaySdk::shutdown() {
    shutDown_.store(true);
    {
        std::lock_guard lock(mutex_);
        deviceListeners_.clear();
        appListeners_.clear();
    }

    std::lock_guard lock(threadMutex_);
    if (!thread_.joinable()) {
        return;
    }
    thread_.request_stop();
    if (thread_.get_id() == std::this_thread::get_id()) {
        // shutdown from one of our own callbacks
        thread_.detach();
        return;
    }
    thread_.join();
}

void ReplaySdk::ensureBound(const char* operation) const {
    if (bindingLost_.load() || shutDown_.load()) {
        THROW_SDK_NOT_INITIALIZED("SDK not initialized (", operation, ")");
    }
}

auto ReplaySdk::knownDevices() -> std::vector<device::Device> {
    ensureBound("knownDevices");
    return scenario_->devices();
}

auto ReplaySdk::connectedDevices() -> std::vector<device::Device> {
    ensureBound("connectedDevices");
    std::vector<device::Device> connected;
    for (const auto& dev : scenario_->devices()) {
        if (dev.connectionState == device::ConnectionState::Connected) {
            connected.push_back(dev);
        }
    }
    return connected;
}

void ReplaySdk::registerForDeviceEvents(const device::Device& device,
                                        DeviceStatusCallback callback) {
    ensureBound("registerForDeviceEvents");
    std::lock_guard lock(mutex_);
    deviceListeners_[device.id] = std::move(callback);
}

void ReplaySdk::unregisterForDeviceEvents(const device::Device& device) {
    std::lock_guard lock(mutex_);
    deviceListeners_.erase(device.id);
}

void ReplaySdk::registerForAppEvents(const device::Device& device,
                                     const std::string& appId,
                                     AppMessageCallback callback) {
    ensureBound("registerForAppEvents");
    std::lock_guard lock(mutex_);
    appListeners_[std::make_pair(device.id, appId)] = std::move(callback);
}

void ReplaySdk::unregisterForAppEvents(const device::Device& device,
                                       const std::string& appId) {
    std::lock_guard lock(mutex_);
    appListeners_.erase(std::make_pair(device.id, appId));
}

auto makeReplayFactory(std::shared_ptr<ReplayScenario> scenario)
    -> SdkFactory {
    return [scenario = std::move(scenario)]() -> std::shared_ptr<WearableSdk> {
        return std::make_shared<ReplaySdk>(scenario);
    };
}

}  // namespace wristlink::sdk
