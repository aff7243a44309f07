/*
 * session_worker.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Long-running listener task: brings the SDK up, relays SDK
             events to the dispatcher until cancelled, tears down

**************************************************/

#ifndef WRISTLINK_WORKER_SESSION_WORKER_HPP
#define WRISTLINK_WORKER_SESSION_WORKER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>

#include "device/device.hpp"
#include "events/event_dispatcher.hpp"
#include "sdk/sdk_error.hpp"
#include "sdk/sdk_events.hpp"
#include "sdk/session_manager.hpp"

namespace wristlink::worker {

enum class WorkerState {
    Starting,
    WaitingForSdk,
    Running,
    Stopping,
    Stopped,
    Failed
};

[[nodiscard]] auto workerStateToString(WorkerState state) -> std::string;

enum class WorkerOutcome { Succeeded, Cancelled, Failed };

[[nodiscard]] auto workerOutcomeToString(WorkerOutcome outcome)
    -> std::string;

struct WorkerResult {
    WorkerOutcome outcome{WorkerOutcome::Succeeded};
    std::string reason;
};

struct WorkerOptions {
    std::string name{"wristlink_listener"};
    std::chrono::milliseconds readyTimeout{30000};
    std::chrono::milliseconds readyPollInterval{500};
    std::chrono::milliseconds settleDelay{1500};
};

/**
 * @brief One listener run.
 *
 * Starting -> WaitingForSdk -> Running -> Stopping -> Stopped, or Failed
 * when the SDK does not come up or anything throws. Created is the first
 * event a run publishes and Terminated the last; every run that gets past
 * construction publishes exactly one Terminated.
 */
class SessionWorker {
public:
    SessionWorker(sdk::SessionManager& session,
                  events::EventDispatcher& dispatcher,
                  WorkerOptions options = {});

    SessionWorker(const SessionWorker&) = delete;
    SessionWorker& operator=(const SessionWorker&) = delete;

    /**
     * @brief Run until @p token is stopped or the session closes.
     *
     * Never throws.
     */
    auto run(std::stop_token token) -> WorkerResult;

    /**
     * @brief Reason carried by Terminated when the run is cancelled
     */
    void setStopReason(std::string reason);

    [[nodiscard]] auto state() const -> WorkerState { return state_.load(); }
    [[nodiscard]] auto startTime() const -> std::int64_t {
        return startTime_.load();
    }
    [[nodiscard]] auto name() const -> const std::string& {
        return options_.name;
    }

private:
    auto waitForSdk(std::stop_token token) -> sdk::SdkVoidResult;
    void handle(const sdk::SdkEvent& event, std::stop_token token);
    void onDeviceStatus(const device::Device& device, std::stop_token token);
    void refreshDevices();

    auto finishCancelled() -> WorkerResult;
    auto finishFailed(const std::string& reason) -> WorkerResult;
    void teardown();
    void setState(WorkerState state);

    sdk::SessionManager& session_;
    events::EventDispatcher& dispatcher_;
    WorkerOptions options_;

    std::atomic<WorkerState> state_{WorkerState::Starting};
    std::atomic<std::int64_t> startTime_{0};
    std::uint64_t readyGeneration_{0};
    device::DeviceSet connected_;

    mutable std::mutex reasonMutex_;
    std::string stopReason_{"cancelled"};
};

}  // namespace wristlink::worker

#endif  // WRISTLINK_WORKER_SESSION_WORKER_HPP
