/*
 * session_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "session_manager.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "message/message_parser.hpp"
#include "sdk_exceptions.hpp"

namespace wristlink::sdk {

auto sessionStateToString(SessionState state) -> std::string {
    switch (state) {
        case SessionState::Uninitialized:
            return "Uninitialized";
        case SessionState::Initializing:
            return "Initializing";
        case SessionState::Ready:
            return "Ready";
        case SessionState::Error:
            return "Error";
        case SessionState::ShutDown:
            return "ShutDown";
    }
    return "Unknown";
}

SessionManager::SessionManager(SdkFactory factory,
                               device::RealDeviceFilter filter,
                               SessionOptions options, utils::Clock clock)
    : factory_(std::move(factory)),
      options_(std::move(options)),
      clock_(clock ? std::move(clock) : utils::Clock(utils::nowMillis)),
      registry_([this] { return handle(); }, std::move(filter)) {
    registry_.setStatusForwarder([this](const device::Device& dev) {
        spdlog::info("[DEVICE-EVENT] {} ({}) is now {}", dev.label(), dev.id,
                     device::connectionStateToString(dev.connectionState));
        events_.send(DeviceStatusChanged{dev});
    });

    registry_.setMessageForwarder(
        [this](const device::Device& dev,
               const std::vector<std::string>& parts) {
            if (parts.empty()) {
                spdlog::warn("[RX] Empty message from {}, dropped",
                             dev.label());
                return;
            }
            auto payload = message::joinMessageParts(parts);
            spdlog::debug("[RX] {}: {}", dev.label(), payload);
            events_.send(AppMessageReceived{dev, std::move(payload), clock_()});
        });
}

SessionManager::~SessionManager() { close(); }

auto SessionManager::init(std::function<void()> onReady,
                          std::stop_token token) -> SdkVoidResult {
    std::unique_lock lock(mutex_);
    switch (state_) {
        case SessionState::ShutDown:
            return sdkFailure(SdkErrorCode::ShutDown, "session is closed");

        case SessionState::Ready:
            lock.unlock();
            spdlog::debug("[INIT] SDK already ready");
            if (onReady) {
                onReady();
            }
            return {};

        case SessionState::Initializing: {
            spdlog::debug("[INIT] Initialization in flight, waiting up to {}ms",
                          options_.initWaitTimeout.count());
            bool resolved = stateCv_.wait_for(
                lock, token, options_.initWaitTimeout,
                [this] { return state_ != SessionState::Initializing; });
            if (!resolved) {
                if (token.stop_requested()) {
                    return sdkFailure(SdkErrorCode::AlreadyInitializing,
                                      "stopped while initialization in flight");
                }
                return sdkFailure(SdkErrorCode::InitTimeout,
                                  "in-flight initialization did not resolve");
            }
            if (state_ == SessionState::Ready) {
                lock.unlock();
                if (onReady) {
                    onReady();
                }
                return {};
            }
            return sdkFailure(SdkErrorCode::InitError,
                              lastError_ ? lastError_->message
                                         : "initialization did not complete");
        }

        case SessionState::Uninitialized:
        case SessionState::Error:
            break;
    }

    auto stale = std::move(sdk_);
    state_ = SessionState::Initializing;
    const auto gen = ++generation_;
    lastError_.reset();
    if (onReady) {
        pendingReady_.push_back(std::move(onReady));
    }
    lock.unlock();

    releaseHandle(stale);

    std::shared_ptr<WearableSdk> sdk;
    try {
        sdk = factory_();
    } catch (const std::exception& e) {
        spdlog::error("[INIT] Failed to create SDK handle: {}", e.what());
        handleInitError(gen, SdkError(SdkErrorCode::InitError, e.what()));
        return sdkFailure(SdkErrorCode::InitError, e.what());
    }
    if (!sdk) {
        handleInitError(
            gen, SdkError(SdkErrorCode::InitError, "factory returned no handle"));
        return sdkFailure(SdkErrorCode::InitError, "factory returned no handle");
    }

    {
        std::lock_guard guard(mutex_);
        if (generation_ != gen) {
            // reset() or close() ran while the handle was being created
            releaseHandle(sdk);
            return sdkFailure(SdkErrorCode::ShutDown,
                              "initialization superseded");
        }
        sdk_ = sdk;
    }

    spdlog::info("[INIT] Initializing {} SDK (generation {})", sdk->name(),
                 gen);
    try {
        sdk->initialize(LifecycleCallbacks{
            [this, gen] { handleReady(gen); },
            [this, gen](const SdkError& error) { handleInitError(gen, error); },
            [this, gen] { handleShutdown(gen); },
        });
    } catch (const std::exception& e) {
        handleInitError(gen, SdkError(SdkErrorCode::InitError, e.what()));
        return sdkFailure(SdkErrorCode::InitError, e.what());
    }
    return {};
}

auto SessionManager::abandonInitialization(std::uint64_t gen,
                                           const std::string& reason) -> bool {
    {
        std::lock_guard lock(mutex_);
        if (gen != generation_ || state_ != SessionState::Initializing) {
            return false;
        }
    }
    spdlog::warn("[INIT] Abandoning initialization (generation {}): {}", gen,
                 reason);
    handleInitError(gen, SdkError(SdkErrorCode::InitTimeout, reason));
    return true;
}

void SessionManager::handleReady(std::uint64_t gen) {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard lock(mutex_);
        if (gen != generation_ || state_ != SessionState::Initializing) {
            spdlog::debug("[INIT] Ignoring ready from stale generation {}",
                          gen);
            return;
        }
        state_ = SessionState::Ready;
        callbacks.swap(pendingReady_);
    }
    stateCv_.notify_all();
    spdlog::info("[INIT] SDK ready (generation {})", gen);
    events_.send(SdkReady{gen});

    for (auto& callback : callbacks) {
        try {
            callback();
        } catch (const std::exception& e) {
            spdlog::error("[INIT] Ready callback failed: {}", e.what());
        }
    }
}

void SessionManager::handleInitError(std::uint64_t gen, const SdkError& error) {
    {
        std::lock_guard lock(mutex_);
        if (gen != generation_) {
            spdlog::debug("[INIT] Ignoring init error from stale generation {}",
                          gen);
            return;
        }
        state_ = SessionState::Error;
        lastError_ = error;
        pendingReady_.clear();
    }
    stateCv_.notify_all();
    spdlog::error("[INIT] SDK initialization failed: {}", error.toString());
    events_.send(SdkInitFailed{gen, error});
}

void SessionManager::handleShutdown(std::uint64_t gen) {
    {
        std::lock_guard lock(mutex_);
        if (gen != generation_) {
            return;
        }
        if (state_ != SessionState::Ready) {
            spdlog::debug("[INIT] SDK shutdown while {}",
                          sessionStateToString(state_));
            return;
        }
        // the handle is released by the next init(), not on the SDK's thread
        state_ = SessionState::Uninitialized;
    }
    stateCv_.notify_all();
    registry_.forgetAll();
    spdlog::warn("[INIT] SDK shut down (generation {})", gen);
    events_.send(SdkShutDown{gen});
}

auto SessionManager::verifyBinding() -> bool {
    auto sdk = handle();
    if (!sdk) {
        spdlog::debug("[RECOVERY] No SDK handle to verify");
        return false;
    }

    try {
        auto devices = sdk->connectedDevices();
        spdlog::debug("[RECOVERY] Binding healthy, {} connected device(s)",
                      devices.size());
        return true;
    } catch (const SdkNotInitializedException& e) {
        spdlog::warn("[RECOVERY] SDK binding lost: {}", e.what());
        triggerRecovery();
    } catch (const std::exception& e) {
        spdlog::warn("[RECOVERY] Health probe failed: {}", e.what());
    }
    return false;
}

auto SessionManager::triggerRecovery() -> bool {
    bool expected = false;
    if (!recovering_.compare_exchange_strong(expected, true)) {
        spdlog::info("[RECOVERY] Recovery already in progress, skipping");
        return false;
    }

    std::shared_ptr<WearableSdk> stale;
    {
        std::lock_guard lock(mutex_);
        if (state_ == SessionState::ShutDown) {
            recovering_.store(false);
            return false;
        }
        stale = std::move(sdk_);
        state_ = SessionState::Uninitialized;
        ++generation_;
        pendingReady_.clear();
    }
    stateCv_.notify_all();

    registry_.forgetAll();
    releaseHandle(stale);

    auto attempt = ++recoveryCount_;
    spdlog::warn("[RECOVERY] Discarded SDK handle, starting recovery #{}",
                 attempt);

    std::lock_guard recoveryLock(recoveryMutex_);
    recoveryThread_ =
        std::jthread([this](std::stop_token token) { runRecovery(token); });
    return true;
}

void SessionManager::runRecovery(std::stop_token token) {
    try {
        auto result = init({}, token);
        if (!result) {
            spdlog::error("[RECOVERY] Re-initialization failed: {}",
                          result.error().toString());
        } else {
            std::unique_lock lock(mutex_);
            bool resolved = stateCv_.wait_for(
                lock, token, options_.recoveryTimeout,
                [this] { return state_ != SessionState::Initializing; });
            if (!resolved) {
                spdlog::warn(
                    "[RECOVERY] SDK not ready after {}ms, releasing guard",
                    options_.recoveryTimeout.count());
            } else {
                spdlog::info("[RECOVERY] Recovery finished, state {}",
                             sessionStateToString(state_));
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[RECOVERY] Recovery aborted: {}", e.what());
    }
    recovering_.store(false);
}

void SessionManager::stopRecoveryThread() {
    std::lock_guard lock(recoveryMutex_);
    if (!recoveryThread_.joinable()) {
        return;
    }
    recoveryThread_.request_stop();
    if (recoveryThread_.get_id() == std::this_thread::get_id()) {
        recoveryThread_.detach();
        return;
    }
    recoveryThread_.join();
}

void SessionManager::reset() {
    stopRecoveryThread();
    registry_.unregisterAll();

    std::shared_ptr<WearableSdk> stale;
    bool wasActive = false;
    {
        std::lock_guard lock(mutex_);
        stale = std::move(sdk_);
        wasActive = stale != nullptr ||
                    (state_ != SessionState::Uninitialized &&
                     state_ != SessionState::ShutDown);
        if (state_ != SessionState::ShutDown) {
            state_ = SessionState::Uninitialized;
        }
        ++generation_;
        pendingReady_.clear();
        lastError_.reset();
    }
    stateCv_.notify_all();

    registry_.forgetAll();
    events_.clear();
    recovering_.store(false);
    releaseHandle(stale);

    if (wasActive) {
        spdlog::info("[INIT] Session reset");
    } else {
        spdlog::debug("[INIT] Session already reset");
    }
}

void SessionManager::close() {
    reset();
    {
        std::lock_guard lock(mutex_);
        if (state_ == SessionState::ShutDown) {
            return;
        }
        state_ = SessionState::ShutDown;
    }
    stateCv_.notify_all();
    events_.close();
    spdlog::info("[INIT] Session closed");
}

auto SessionManager::state() const -> SessionState {
    std::lock_guard lock(mutex_);
    return state_;
}

auto SessionManager::isReady() const -> bool {
    std::lock_guard lock(mutex_);
    return state_ == SessionState::Ready;
}

auto SessionManager::generation() const -> std::uint64_t {
    std::lock_guard lock(mutex_);
    return generation_;
}

auto SessionManager::lastError() const -> std::optional<SdkError> {
    std::lock_guard lock(mutex_);
    return lastError_;
}

auto SessionManager::handle() const -> std::shared_ptr<WearableSdk> {
    std::lock_guard lock(mutex_);
    return sdk_;
}

auto SessionManager::refreshAndRegisterDevices(std::stop_token token)
    -> std::size_t {
    return registry_.refreshAndRegister(options_.appId,
                                        options_.discoveryDelay, token);
}

void SessionManager::releaseHandle(const std::shared_ptr<WearableSdk>& sdk) {
    if (!sdk) {
        return;
    }
    try {
        sdk->shutdown();
    } catch (const std::exception& e) {
        spdlog::warn("[INIT] Error while shutting down SDK handle: {}",
                     e.what());
    }
}

}  // namespace wristlink::sdk
