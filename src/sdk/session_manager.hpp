/*
 * session_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Owner of the wearable SDK handle. Initialization, readiness
             tracking, binding health checks and single-flight recovery.

**************************************************/

#ifndef WRISTLINK_SDK_SESSION_MANAGER_HPP
#define WRISTLINK_SDK_SESSION_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "device/device_registry.hpp"
#include "sdk_error.hpp"
#include "sdk_events.hpp"
#include "utils/time_utils.hpp"
#include "wearable_sdk.hpp"

namespace wristlink::sdk {

enum class SessionState { Uninitialized, Initializing, Ready, Error, ShutDown };

[[nodiscard]] auto sessionStateToString(SessionState state) -> std::string;

struct SessionOptions {
    std::string appId{"7b408c6e-fc9c-4080-bad4-97a3557fc995"};
    std::chrono::milliseconds discoveryDelay{500};
    std::chrono::milliseconds initWaitTimeout{8000};
    std::chrono::milliseconds recoveryTimeout{5000};
};

/**
 * @brief The single SDK session of the process.
 *
 * Constructed once at startup and handed to the worker and controller by
 * reference. At most one initialization is in flight at any time; callers
 * arriving while one is running wait for its outcome instead of creating a
 * second handle.
 *
 * Every SDK callback is turned into an SdkEvent on events(). Lifecycle
 * callbacks carry the generation of the handle that produced them, and
 * callbacks from a replaced handle are ignored.
 *
 * State machine:
 *   Uninitialized --init()--> Initializing --ready--> Ready
 *   Initializing --error--> Error
 *   Ready --shutdown--> Uninitialized
 *   any --reset()--> Uninitialized, any --close()--> ShutDown
 */
class SessionManager {
public:
    SessionManager(SdkFactory factory, device::RealDeviceFilter filter,
                   SessionOptions options = {},
                   utils::Clock clock = utils::nowMillis);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Bring the SDK up.
     *
     * Ready: invokes @p onReady synchronously and returns success.
     * Initializing: blocks up to initWaitTimeout for the in-flight attempt,
     * or until @p token is stopped.
     * Otherwise a new handle is created and initialization started;
     * @p onReady runs once the SDK reports ready.
     */
    auto init(std::function<void()> onReady = {}, std::stop_token token = {})
        -> SdkVoidResult;

    /**
     * @brief Give up on an initialization that never resolved.
     *
     * Moves the session from Initializing to Error with InitTimeout so the
     * next init() creates a fresh handle. No effect if @p generation is no
     * longer current or the attempt already resolved.
     * @return true if the attempt was abandoned
     */
    auto abandonInitialization(std::uint64_t generation,
                               const std::string& reason) -> bool;

    /**
     * @brief Probe the handle with a device query.
     *
     * A stale handle triggers recovery.
     * @return true if the binding is healthy
     */
    auto verifyBinding() -> bool;

    /**
     * @brief Discard the handle and re-initialize out of band.
     *
     * Single flight: returns false without doing anything if a recovery is
     * already running. The guard is cleared when the new handle resolves or
     * after recoveryTimeout, whichever comes first.
     */
    auto triggerRecovery() -> bool;

    /**
     * @brief Full teardown back to Uninitialized. Safe to call repeatedly.
     */
    void reset();

    /**
     * @brief reset() and refuse any further init()
     */
    void close();

    [[nodiscard]] auto state() const -> SessionState;
    [[nodiscard]] auto isReady() const -> bool;
    [[nodiscard]] auto isRecovering() const -> bool {
        return recovering_.load();
    }
    [[nodiscard]] auto generation() const -> std::uint64_t;
    [[nodiscard]] auto recoveryCount() const -> std::uint64_t {
        return recoveryCount_.load();
    }
    [[nodiscard]] auto lastError() const -> std::optional<SdkError>;

    /**
     * @brief Current handle, nullptr if none
     */
    [[nodiscard]] auto handle() const -> std::shared_ptr<WearableSdk>;

    [[nodiscard]] auto registry() -> device::DeviceRegistry& {
        return registry_;
    }
    [[nodiscard]] auto events() -> SdkEventChannel& { return events_; }
    [[nodiscard]] auto options() const -> const SessionOptions& {
        return options_;
    }

    /**
     * @brief Register listeners for every known real device
     */
    auto refreshAndRegisterDevices(std::stop_token token = {})
        -> std::size_t;

private:
    void handleReady(std::uint64_t generation);
    void handleInitError(std::uint64_t generation, const SdkError& error);
    void handleShutdown(std::uint64_t generation);
    void runRecovery(std::stop_token token);
    void stopRecoveryThread();

    static void releaseHandle(const std::shared_ptr<WearableSdk>& sdk);

    SdkFactory factory_;
    SessionOptions options_;
    utils::Clock clock_;

    mutable std::mutex mutex_;
    std::condition_variable_any stateCv_;
    SessionState state_{SessionState::Uninitialized};
    std::shared_ptr<WearableSdk> sdk_;
    std::uint64_t generation_{0};
    std::vector<std::function<void()>> pendingReady_;
    std::optional<SdkError> lastError_;

    std::atomic<bool> recovering_{false};
    std::atomic<std::uint64_t> recoveryCount_{0};
    std::mutex recoveryMutex_;
    std::jthread recoveryThread_;

    SdkEventChannel events_;
    device::DeviceRegistry registry_;
};

}  // namespace wristlink::sdk

#endif  // WRISTLINK_SDK_SESSION_MANAGER_HPP
