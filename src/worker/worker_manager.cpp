/*
 * worker_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "worker_manager.hpp"

#include <vector>

#include <spdlog/spdlog.h>

#include "atom/error/exception.hpp"

namespace wristlink::worker {

auto existingWorkPolicyToString(ExistingWorkPolicy policy) -> std::string {
    switch (policy) {
        case ExistingWorkPolicy::Keep:
            return "keep";
        case ExistingWorkPolicy::Replace:
            return "replace";
        case ExistingWorkPolicy::Reject:
            return "reject";
    }
    return "keep";
}

auto existingWorkPolicyFromString(const std::string& value)
    -> std::optional<ExistingWorkPolicy> {
    if (value == "keep") return ExistingWorkPolicy::Keep;
    if (value == "replace") return ExistingWorkPolicy::Replace;
    if (value == "reject") return ExistingWorkPolicy::Reject;
    return std::nullopt;
}

auto startOutcomeToString(StartOutcome outcome) -> std::string {
    switch (outcome) {
        case StartOutcome::Started:
            return "Started";
        case StartOutcome::KeptExisting:
            return "KeptExisting";
        case StartOutcome::Replaced:
            return "Replaced";
        case StartOutcome::Rejected:
            return "Rejected";
    }
    return "Unknown";
}

auto stopOutcomeToString(StopOutcome outcome) -> std::string {
    switch (outcome) {
        case StopOutcome::NotRunning:
            return "NotRunning";
        case StopOutcome::Stopped:
            return "Stopped";
        case StopOutcome::TimedOut:
            return "TimedOut";
    }
    return "Unknown";
}

WorkerManager::WorkerManager(WorkerFactory factory, ExistingWorkPolicy policy,
                             std::chrono::milliseconds stopCheckInterval,
                             int maxStopChecks)
    : factory_(std::move(factory)),
      policy_(policy),
      stopCheckInterval_(stopCheckInterval),
      maxStopChecks_(maxStopChecks) {
    if (!factory_) {
        THROW_INVALID_ARGUMENT("worker factory is required");
    }
}

WorkerManager::~WorkerManager() { stopAll("shutdown"); }

auto WorkerManager::findSlot(const std::string& name) const
    -> std::shared_ptr<Slot> {
    std::lock_guard lock(mutex_);
    auto it = slots_.find(name);
    return it == slots_.end() ? nullptr : it->second;
}

auto WorkerManager::start(const std::string& name) -> StartOutcome {
    std::lock_guard op(operationMutex_);

    bool replaced = false;
    if (auto existing = findSlot(name)) {
        if (!existing->finished.load()) {
            switch (policy_) {
                case ExistingWorkPolicy::Keep:
                    spdlog::info("[WORKER] {} already running, keeping it",
                                 name);
                    return StartOutcome::KeptExisting;
                case ExistingWorkPolicy::Reject:
                    spdlog::warn("[WORKER] {} already running, start rejected",
                                 name);
                    return StartOutcome::Rejected;
                case ExistingWorkPolicy::Replace:
                    spdlog::info("[WORKER] Replacing running {}", name);
                    existing->worker->setStopReason("replaced");
                    existing->thread.request_stop();
                    replaced = true;
                    break;
            }
        }
        if (existing->thread.joinable()) {
            existing->thread.join();
        }
    }

    launch(name);
    return replaced ? StartOutcome::Replaced : StartOutcome::Started;
}

auto WorkerManager::launch(const std::string& name) -> std::shared_ptr<Slot> {
    auto slot = std::make_shared<Slot>();
    slot->worker = factory_(name);
    {
        std::lock_guard lock(mutex_);
        slots_[name] = slot;
    }

    auto* raw = slot.get();
    slot->thread = std::jthread([raw](std::stop_token token) {
        auto result = raw->worker->run(token);
        {
            std::lock_guard lock(raw->resultMutex);
            raw->result = result;
        }
        raw->finished.store(true);
    });
    spdlog::info("[WORKER] Started {}", name);
    return slot;
}

auto WorkerManager::stop(const std::string& name, const std::string& reason)
    -> StopOutcome {
    std::lock_guard op(operationMutex_);
    return stopSlot(name, findSlot(name), reason);
}

auto WorkerManager::stopSlot(const std::string& name,
                             const std::shared_ptr<Slot>& slot,
                             const std::string& reason) -> StopOutcome {
    if (!slot || !slot->thread.joinable()) {
        return StopOutcome::NotRunning;
    }
    if (slot->finished.load()) {
        slot->thread.join();
        return StopOutcome::NotRunning;
    }

    spdlog::info("[WORKER] Stopping {}: {}", name, reason);
    slot->worker->setStopReason(reason);
    slot->thread.request_stop();

    for (int check = 0; check < maxStopChecks_; ++check) {
        if (slot->finished.load()) {
            break;
        }
        std::this_thread::sleep_for(stopCheckInterval_);
    }
    if (!slot->finished.load()) {
        spdlog::error("[WORKER] {} did not stop within {}ms", name,
                      stopCheckInterval_.count() * maxStopChecks_);
        return StopOutcome::TimedOut;
    }
    slot->thread.join();
    return StopOutcome::Stopped;
}

void WorkerManager::stopAll(const std::string& reason) {
    std::lock_guard op(operationMutex_);
    std::vector<std::pair<std::string, std::shared_ptr<Slot>>> slots;
    {
        std::lock_guard lock(mutex_);
        slots.assign(slots_.begin(), slots_.end());
    }
    for (auto& [name, slot] : slots) {
        if (stopSlot(name, slot, reason) == StopOutcome::TimedOut) {
            // nothing else can be done but wait for it
            slot->thread.join();
        }
    }
}

auto WorkerManager::isRunning(const std::string& name) const -> bool {
    auto slot = findSlot(name);
    return slot && !slot->finished.load();
}

auto WorkerManager::startTime(const std::string& name) const -> std::int64_t {
    auto slot = findSlot(name);
    if (!slot || slot->finished.load()) {
        return 0;
    }
    return slot->worker->startTime();
}

auto WorkerManager::state(const std::string& name) const
    -> std::optional<WorkerState> {
    auto slot = findSlot(name);
    if (!slot) {
        return std::nullopt;
    }
    return slot->worker->state();
}

auto WorkerManager::lastResult(const std::string& name) const
    -> std::optional<WorkerResult> {
    auto slot = findSlot(name);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard lock(slot->resultMutex);
    return slot->result;
}

}  // namespace wristlink::worker
