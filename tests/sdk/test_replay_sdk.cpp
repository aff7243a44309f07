/*
 * test_replay_sdk.cpp - Tests for the scenario-driven SDK backend
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "fakes/fake_wearable_sdk.hpp"
#include "sdk/replay_sdk.hpp"
#include "sdk/sdk_exceptions.hpp"

using namespace wristlink;
using namespace wristlink::sdk;
using namespace std::chrono_literals;
using test::waitUntil;

class ReplaySdkTest : public ::testing::Test {
protected:
    static auto scenarioJson() -> json {
        return json::parse(R"({
            "readyDelayMs": 10,
            "devices": [
                {"id": 1, "name": "Fenix", "state": "CONNECTED"},
                {"id": 2, "name": "Venu", "state": "NOT_CONNECTED"}
            ],
            "steps": [
                {"type": "message", "delayMs": 50, "device": 1,
                 "parts": ["STARTED", "100", "run", "0"]},
                {"type": "status", "delayMs": 5, "device": 2, "state": "CONNECTED"},
                {"type": "message", "delayMs": 5, "device": 1,
                 "payload": "STOPPED|160|run|60"}
            ]
        })");
    }

    std::mutex mutex_;
    std::vector<std::string> received_;
    std::vector<device::Device> statuses_;
};

// ============================================================================
// Scenario
// ============================================================================

TEST_F(ReplaySdkTest, ScenarioFromJson) {
    auto scenario = ReplayScenario::fromJson(scenarioJson());
    EXPECT_EQ(scenario->readyDelay(), 10ms);
    EXPECT_EQ(scenario->devices().size(), 2u);
    EXPECT_EQ(scenario->remainingSteps(), 3u);

    auto first = scenario->nextStep();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->type, ReplayStepType::Message);
    EXPECT_EQ(first->parts.size(), 4u);
    EXPECT_EQ(scenario->remainingSteps(), 2u);
}

TEST_F(ReplaySdkTest, PayloadStepBecomesSinglePart) {
    auto step = ReplayStep::fromJson(
        json{{"type", "message"}, {"payload", "STOPPED|1|run|2"}});
    ASSERT_EQ(step.parts.size(), 1u);
    EXPECT_EQ(step.parts[0], "STOPPED|1|run|2");
    EXPECT_EQ(step.toJson()["type"], "message");
}

TEST_F(ReplaySdkTest, UnknownStepTypeThrows) {
    EXPECT_THROW(ReplayStep::fromJson(json{{"type", "explode"}}),
                 SdkOperationException);
}

TEST_F(ReplaySdkTest, MissingFileThrows) {
    EXPECT_THROW(ReplayScenario::loadFile("/nonexistent/scenario.json"),
                 SdkOperationException);
}

TEST_F(ReplaySdkTest, SetDeviceStateUnknownId) {
    auto scenario = ReplayScenario::fromJson(scenarioJson());
    EXPECT_FALSE(scenario->setDeviceState(99, device::ConnectionState::Connected));
    auto updated = scenario->setDeviceState(2, device::ConnectionState::Connected);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->connectionState, device::ConnectionState::Connected);
}

// ============================================================================
// Playback
// ============================================================================

TEST_F(ReplaySdkTest, ReplaysStepsToRegisteredListeners) {
    auto scenario = ReplayScenario::fromJson(scenarioJson());
    ReplaySdk sdk(scenario);
    std::atomic<bool> ready{false};

    LifecycleCallbacks callbacks;
    callbacks.onReady = [&] {
        for (const auto& dev : sdk.knownDevices()) {
            sdk.registerForDeviceEvents(dev, [this](const device::Device& d) {
                std::lock_guard lock(mutex_);
                statuses_.push_back(d);
            });
            sdk.registerForAppEvents(
                dev, "app", [this](const device::Device&,
                                   const std::vector<std::string>& parts) {
                    std::lock_guard lock(mutex_);
                    received_.push_back(parts.size() == 1 ? parts[0]
                                                          : parts[0] + "+");
                });
        }
        ready = true;
    };
    sdk.initialize(callbacks);

    ASSERT_TRUE(waitUntil([&] { return ready.load(); }));
    ASSERT_TRUE(waitUntil([&] {
        std::lock_guard lock(mutex_);
        return received_.size() == 2u;
    }));

    std::lock_guard lock(mutex_);
    EXPECT_EQ(received_[0], "STARTED+");
    EXPECT_EQ(received_[1], "STOPPED|160|run|60");
    ASSERT_EQ(statuses_.size(), 1u);
    EXPECT_EQ(statuses_[0].id, 2);
    EXPECT_EQ(sdk.connectedDevices().size(), 2u);
}

TEST_F(ReplaySdkTest, InitErrorFiresOnce) {
    auto j = scenarioJson();
    j["initError"] = true;
    j["initErrorMessage"] = "service unavailable";
    auto scenario = ReplayScenario::fromJson(j);

    std::atomic<int> errors{0};
    std::atomic<int> readies{0};
    LifecycleCallbacks callbacks;
    callbacks.onReady = [&] { ++readies; };
    callbacks.onInitializeError = [&](const SdkError& error) {
        EXPECT_EQ(error.message, "service unavailable");
        ++errors;
    };

    {
        ReplaySdk first(scenario);
        first.initialize(callbacks);
        ASSERT_TRUE(waitUntil([&] { return errors.load() == 1; }));
    }
    ReplaySdk second(scenario);
    second.initialize(callbacks);
    EXPECT_TRUE(waitUntil([&] { return readies.load() == 1; }));
    EXPECT_EQ(errors.load(), 1);
}

TEST_F(ReplaySdkTest, BindingLostMakesQueriesThrow) {
    auto scenario = std::make_shared<ReplayScenario>(
        std::vector<device::Device>{{1, "Fenix", device::ConnectionState::Connected}},
        std::vector<ReplayStep>{
            ReplayStep{ReplayStepType::BindingLost, 0ms, 1, {}, {}, {}},
            ReplayStep{ReplayStepType::Message, 0ms, 1, {"STARTED|1|a|0"}, {}, {}},
        },
        0ms);
    ReplaySdk sdk(scenario);
    std::atomic<bool> ready{false};
    LifecycleCallbacks callbacks;
    callbacks.onReady = [&] { ready = true; };
    sdk.initialize(callbacks);

    ASSERT_TRUE(waitUntil([&] { return sdk.isBindingLost(); }));
    EXPECT_THROW(sdk.connectedDevices(), SdkNotInitializedException);
    EXPECT_THROW(sdk.knownDevices(), SdkNotInitializedException);
    // the stale handle leaves the rest of the scenario to its successor
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(scenario->remainingSteps(), 1u);
}

TEST_F(ReplaySdkTest, ShutdownIsIdempotent) {
    auto scenario = ReplayScenario::fromJson(scenarioJson());
    ReplaySdk sdk(scenario);
    sdk.initialize({});
    EXPECT_NO_THROW(sdk.shutdown());
    EXPECT_NO_THROW(sdk.shutdown());
    EXPECT_THROW(sdk.connectedDevices(), SdkNotInitializedException);
    EXPECT_THROW(sdk.initialize({}), SdkOperationException);
}

TEST_F(ReplaySdkTest, FactorySharesScenario) {
    auto scenario = ReplayScenario::fromJson(scenarioJson());
    auto factory = makeReplayFactory(scenario);
    auto a = factory();
    auto b = factory();
    ASSERT_NE(a, nullptr);
    EXPECT_NE(a, b);
    EXPECT_EQ(a->name(), b->name());
}
