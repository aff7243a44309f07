/*
 * session_worker.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "session_worker.hpp"

#include <algorithm>
#include <exception>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "utils/time_utils.hpp"

namespace wristlink::worker {

auto workerStateToString(WorkerState state) -> std::string {
    switch (state) {
        case WorkerState::Starting:
            return "Starting";
        case WorkerState::WaitingForSdk:
            return "WaitingForSdk";
        case WorkerState::Running:
            return "Running";
        case WorkerState::Stopping:
            return "Stopping";
        case WorkerState::Stopped:
            return "Stopped";
        case WorkerState::Failed:
            return "Failed";
    }
    return "Unknown";
}

auto workerOutcomeToString(WorkerOutcome outcome) -> std::string {
    switch (outcome) {
        case WorkerOutcome::Succeeded:
            return "Succeeded";
        case WorkerOutcome::Cancelled:
            return "Cancelled";
        case WorkerOutcome::Failed:
            return "Failed";
    }
    return "Unknown";
}

SessionWorker::SessionWorker(sdk::SessionManager& session,
                             events::EventDispatcher& dispatcher,
                             WorkerOptions options)
    : session_(session), dispatcher_(dispatcher), options_(std::move(options)) {}

void SessionWorker::setStopReason(std::string reason) {
    std::lock_guard lock(reasonMutex_);
    stopReason_ = std::move(reason);
}

void SessionWorker::setState(WorkerState state) {
    auto previous = state_.exchange(state);
    if (previous != state) {
        spdlog::debug("[WORKER] {}: {} -> {}", options_.name,
                      workerStateToString(previous), workerStateToString(state));
    }
}

auto SessionWorker::run(std::stop_token token) -> WorkerResult {
    setState(WorkerState::Starting);
    startTime_.store(dispatcher_.now());
    spdlog::info("[WORKER] {} starting", options_.name);

    try {
        setState(WorkerState::WaitingForSdk);
        auto ready = waitForSdk(token);
        if (token.stop_requested()) {
            return finishCancelled();
        }
        if (!ready) {
            return finishFailed("error: " + ready.error().toString());
        }
        readyGeneration_ = session_.generation();

        if (!utils::interruptibleSleep(token, options_.settleDelay)) {
            return finishCancelled();
        }
        auto registered = session_.refreshAndRegisterDevices(token);
        if (token.stop_requested()) {
            return finishCancelled();
        }
        spdlog::info("[WORKER] Listening on {} device(s)", registered);

        connected_ = session_.registry().listConnectedReal();
        dispatcher_.resetDevices(connected_);
        std::vector<std::string> names;
        for (const auto& [id, dev] : connected_) {
            names.push_back(dev.label());
        }
        dispatcher_.publish(message::CreatedEvent{
            startTime_.load(), static_cast<int>(connected_.size()), names});
        setState(WorkerState::Running);

        while (auto event = session_.events().receive(token)) {
            handle(*event, token);
        }
        if (!token.stop_requested()) {
            setStopReason("session closed");
        }
        return finishCancelled();
    } catch (const std::exception& e) {
        spdlog::error("[WORKER] {} failed: {}", options_.name, e.what());
        return finishFailed(std::string("error: ") + e.what());
    }
}

auto SessionWorker::waitForSdk(std::stop_token token) -> sdk::SdkVoidResult {
    auto result = session_.init({}, token);
    if (!result) {
        return result;
    }
    const auto generation = session_.generation();

    const auto deadline =
        std::chrono::steady_clock::now() + options_.readyTimeout;
    while (!token.stop_requested()) {
        switch (session_.state()) {
            case sdk::SessionState::Ready:
                return {};
            case sdk::SessionState::Error: {
                auto error = session_.lastError();
                return sdk::sdkFailure(
                    sdk::SdkErrorCode::InitError,
                    error ? error->message : "SDK reported an error");
            }
            case sdk::SessionState::ShutDown:
                return sdk::sdkFailure(sdk::SdkErrorCode::ShutDown,
                                       "session closed");
            default:
                break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            auto reason = "SDK not ready within " +
                          std::to_string(options_.readyTimeout.count()) + "ms";
            // the next run starts a fresh handle instead of waiting on this one
            session_.abandonInitialization(generation, reason);
            return sdk::sdkFailure(sdk::SdkErrorCode::InitTimeout, reason);
        }
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        spdlog::debug("[WORKER] Waiting for SDK ({}ms left)", remaining.count());
        utils::interruptibleSleep(token,
                                  std::min(options_.readyPollInterval, remaining));
    }
    return {};
}

void SessionWorker::handle(const sdk::SdkEvent& event, std::stop_token token) {
    if (const auto* msg = std::get_if<sdk::AppMessageReceived>(&event)) {
        dispatcher_.onMessage(msg->payload, msg->device.label(),
                              msg->receiveTime);
        return;
    }
    if (const auto* status = std::get_if<sdk::DeviceStatusChanged>(&event)) {
        onDeviceStatus(status->device, token);
        return;
    }
    if (const auto* ready = std::get_if<sdk::SdkReady>(&event)) {
        if (ready->generation <= readyGeneration_) {
            return;
        }
        readyGeneration_ = ready->generation;
        spdlog::info("[RECOVERY] SDK is back, re-registering listeners");
        session_.refreshAndRegisterDevices(token);
        refreshDevices();
        return;
    }
    if (const auto* failed = std::get_if<sdk::SdkInitFailed>(&event)) {
        if (failed->generation > readyGeneration_) {
            spdlog::warn("[RECOVERY] Re-initialization failed: {}",
                         failed->error.toString());
        }
        return;
    }
    if (std::holds_alternative<sdk::SdkShutDown>(event)) {
        spdlog::warn("[WORKER] SDK shut down underneath the listener");
        session_.triggerRecovery();
    }
}

void SessionWorker::onDeviceStatus(const device::Device& device,
                                   std::stop_token token) {
    if (!session_.registry().filter().isRealDevice(device)) {
        return;
    }
    if (device.connectionState == device::ConnectionState::Connected) {
        // a stale binding only shows up on the next real query
        if (!session_.verifyBinding()) {
            return;
        }
        if (token.stop_requested()) {
            return;
        }
    }
    refreshDevices();
}

void SessionWorker::refreshDevices() {
    auto current = session_.registry().listConnectedReal();
    if (auto error = session_.registry().lastError()) {
        spdlog::warn("[DEVICES] Keeping previous device list: {}", *error);
        return;
    }

    auto diff = device::diffDevices(connected_, current);
    connected_ = std::move(current);
    if (diff.empty()) {
        return;
    }

    for (const auto& dev : diff.added) {
        session_.registry().registerDeviceListener(dev);
        session_.registry().registerAppListener(dev, session_.options().appId);
    }
    dispatcher_.onDeviceChange(diff.added, diff.removed);
}

void SessionWorker::teardown() {
    try {
        session_.registry().unregisterAll();
    } catch (const std::exception& e) {
        spdlog::error("[WORKER] Listener teardown failed: {}", e.what());
    }
    connected_.clear();
    dispatcher_.markStopped();
}

auto SessionWorker::finishCancelled() -> WorkerResult {
    setState(WorkerState::Stopping);
    std::string reason;
    {
        std::lock_guard lock(reasonMutex_);
        reason = stopReason_;
    }
    teardown();
    dispatcher_.publish(message::TerminatedEvent{reason});
    setState(WorkerState::Stopped);
    spdlog::info("[WORKER] {} stopped: {}", options_.name, reason);
    return {WorkerOutcome::Cancelled, reason};
}

auto SessionWorker::finishFailed(const std::string& reason) -> WorkerResult {
    setState(WorkerState::Stopping);
    teardown();
    dispatcher_.publish(message::TerminatedEvent{reason});
    setState(WorkerState::Failed);
    spdlog::error("[WORKER] {} failed: {}", options_.name, reason);
    return {WorkerOutcome::Failed, reason};
}

}  // namespace wristlink::worker
