/*
 * worker_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Runs session workers on their own threads, one per logical
             session name

**************************************************/

#ifndef WRISTLINK_WORKER_WORKER_MANAGER_HPP
#define WRISTLINK_WORKER_WORKER_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "session_worker.hpp"

namespace wristlink::worker {

/**
 * @brief What start() does while a worker with the same name is active
 */
enum class ExistingWorkPolicy {
    Keep,     // leave the running worker alone
    Replace,  // stop it, then start a fresh one
    Reject    // refuse the request
};

[[nodiscard]] auto existingWorkPolicyToString(ExistingWorkPolicy policy)
    -> std::string;
[[nodiscard]] auto existingWorkPolicyFromString(const std::string& value)
    -> std::optional<ExistingWorkPolicy>;

enum class StartOutcome { Started, KeptExisting, Replaced, Rejected };

[[nodiscard]] auto startOutcomeToString(StartOutcome outcome) -> std::string;

enum class StopOutcome { NotRunning, Stopped, TimedOut };

[[nodiscard]] auto stopOutcomeToString(StopOutcome outcome) -> std::string;

using WorkerFactory =
    std::function<std::unique_ptr<SessionWorker>(const std::string& name)>;

class WorkerManager {
public:
    WorkerManager(WorkerFactory factory, ExistingWorkPolicy policy,
                  std::chrono::milliseconds stopCheckInterval =
                      std::chrono::milliseconds(100),
                  int maxStopChecks = 20);
    ~WorkerManager();

    WorkerManager(const WorkerManager&) = delete;
    WorkerManager& operator=(const WorkerManager&) = delete;

    auto start(const std::string& name) -> StartOutcome;

    /**
     * @brief Cancel the named worker and wait up to
     * maxStopChecks x stopCheckInterval for it to finish.
     */
    auto stop(const std::string& name, const std::string& reason)
        -> StopOutcome;

    /**
     * @brief Stop every worker and join all threads
     */
    void stopAll(const std::string& reason);

    [[nodiscard]] auto isRunning(const std::string& name) const -> bool;

    /**
     * @brief Start time (ms) of the running worker, 0 if none
     */
    [[nodiscard]] auto startTime(const std::string& name) const
        -> std::int64_t;

    [[nodiscard]] auto state(const std::string& name) const
        -> std::optional<WorkerState>;
    [[nodiscard]] auto lastResult(const std::string& name) const
        -> std::optional<WorkerResult>;

    [[nodiscard]] auto policy() const -> ExistingWorkPolicy { return policy_; }

private:
    struct Slot {
        std::unique_ptr<SessionWorker> worker;
        std::jthread thread;
        std::atomic<bool> finished{false};
        mutable std::mutex resultMutex;
        std::optional<WorkerResult> result;
    };

    auto findSlot(const std::string& name) const -> std::shared_ptr<Slot>;
    auto launch(const std::string& name) -> std::shared_ptr<Slot>;
    auto stopSlot(const std::string& name, const std::shared_ptr<Slot>& slot,
                  const std::string& reason) -> StopOutcome;

    WorkerFactory factory_;
    ExistingWorkPolicy policy_;
    std::chrono::milliseconds stopCheckInterval_;
    int maxStopChecks_;

    std::mutex operationMutex_;  // serializes start/stop
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;
};

}  // namespace wristlink::worker

#endif  // WRISTLINK_WORKER_WORKER_MANAGER_HPP
