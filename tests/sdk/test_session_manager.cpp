/*
 * test_session_manager.cpp - Tests for SDK session lifecycle and recovery
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <latch>
#include <stop_token>
#include <thread>
#include <variant>
#include <vector>

#include "fakes/fake_wearable_sdk.hpp"
#include "sdk/session_manager.hpp"

using namespace wristlink;
using namespace wristlink::sdk;
using namespace std::chrono_literals;
using test::FakeSdkFactory;
using test::FakeWearableSdk;
using test::makeDevice;
using test::waitUntil;

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.appId = "app-1";
        options_.discoveryDelay = 0ms;
        options_.initWaitTimeout = 2000ms;
        options_.recoveryTimeout = 2000ms;
    }

    auto makeSession(FakeSdkFactory& factory) -> std::unique_ptr<SessionManager> {
        return std::make_unique<SessionManager>(
            factory.factory(), device::RealDeviceFilter{}, options_,
            [] { return std::int64_t{1000}; });
    }

    template <typename T>
    static auto drainFor(SessionManager& session) -> std::vector<T> {
        std::vector<T> found;
        while (auto event = session.events().tryReceive()) {
            if (auto* match = std::get_if<T>(&*event)) {
                found.push_back(*match);
            }
        }
        return found;
    }

    SessionOptions options_;
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(SessionManagerTest, InitReachesReady) {
    FakeSdkFactory factory;
    auto session = makeSession(factory);
    int readyCalls = 0;

    auto result = session->init([&readyCalls] { ++readyCalls; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(session->state(), SessionState::Ready);
    EXPECT_TRUE(session->isReady());
    EXPECT_EQ(readyCalls, 1);
    EXPECT_EQ(factory.created(), 1u);
    EXPECT_EQ(drainFor<SdkReady>(*session).size(), 1u);
}

TEST_F(SessionManagerTest, InitWhenReadyReusesHandle) {
    FakeSdkFactory factory;
    auto session = makeSession(factory);
    int readyCalls = 0;

    ASSERT_TRUE(session->init().has_value());
    ASSERT_TRUE(session->init([&readyCalls] { ++readyCalls; }).has_value());
    EXPECT_EQ(readyCalls, 1);
    EXPECT_EQ(factory.created(), 1u);
    EXPECT_EQ(factory.last()->initializeCalls.load(), 1);
}

TEST_F(SessionManagerTest, ConcurrentInitCreatesOneHandle) {
    FakeSdkFactory factory(FakeWearableSdk::InitMode::Manual);
    auto session = makeSession(factory);

    ASSERT_TRUE(session->init().has_value());
    EXPECT_EQ(session->state(), SessionState::Initializing);

    std::atomic<bool> waiterOk{false};
    std::thread waiter([&] { waiterOk = session->init().has_value(); });

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(factory.created(), 1u);
    factory.last()->fireReady();
    waiter.join();

    EXPECT_TRUE(waiterOk.load());
    EXPECT_EQ(factory.created(), 1u);
    EXPECT_TRUE(session->isReady());
}

TEST_F(SessionManagerTest, LateInitTimesOut) {
    options_.initWaitTimeout = 50ms;
    FakeSdkFactory factory(FakeWearableSdk::InitMode::Manual);
    auto session = makeSession(factory);

    ASSERT_TRUE(session->init().has_value());
    auto late = session->init();
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().code, SdkErrorCode::InitTimeout);
    EXPECT_EQ(factory.created(), 1u);
}

TEST_F(SessionManagerTest, InitErrorThenRetry) {
    FakeSdkFactory factory(FakeWearableSdk::InitMode::Error);
    auto session = makeSession(factory);

    ASSERT_TRUE(session->init().has_value());
    EXPECT_EQ(session->state(), SessionState::Error);
    ASSERT_TRUE(session->lastError().has_value());
    EXPECT_EQ(session->lastError()->code, SdkErrorCode::InitError);
    EXPECT_EQ(drainFor<SdkInitFailed>(*session).size(), 1u);

    factory.setMode(FakeWearableSdk::InitMode::Ready);
    ASSERT_TRUE(session->init().has_value());
    EXPECT_TRUE(session->isReady());
    EXPECT_EQ(factory.created(), 2u);
    // the failed handle is released before the new one is created
    EXPECT_EQ(factory.at(0)->shutdownCalls.load(), 1);
}

TEST_F(SessionManagerTest, FactoryFailureIsReported) {
    SessionManager session(
        []() -> std::shared_ptr<WearableSdk> { return nullptr; },
        device::RealDeviceFilter{}, options_);
    auto result = session.init();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SdkErrorCode::InitError);
    EXPECT_EQ(session.state(), SessionState::Error);
}

TEST_F(SessionManagerTest, StaleCallbacksAreIgnored) {
    FakeSdkFactory factory(FakeWearableSdk::InitMode::Manual);
    auto session = makeSession(factory);

    ASSERT_TRUE(session->init().has_value());
    auto first = factory.last();
    session->reset();
    ASSERT_TRUE(session->init().has_value());
    auto second = factory.last();
    ASSERT_NE(first, second);

    first->fireReady();
    EXPECT_EQ(session->state(), SessionState::Initializing);
    second->fireReady();
    EXPECT_EQ(session->state(), SessionState::Ready);
}

TEST_F(SessionManagerTest, ShutdownCallbackReturnsToUninitialized) {
    FakeSdkFactory factory(FakeWearableSdk::InitMode::Ready, [](FakeWearableSdk& sdk) {
        sdk.setDevices({makeDevice(1, "Fenix")});
    });
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());
    EXPECT_EQ(session->refreshAndRegisterDevices(), 1u);

    factory.last()->fireShutdown();
    EXPECT_EQ(session->state(), SessionState::Uninitialized);
    EXPECT_TRUE(session->registry().empty());
    EXPECT_EQ(drainFor<SdkShutDown>(*session).size(), 1u);
}

// ============================================================================
// Callback Forwarding
// ============================================================================

TEST_F(SessionManagerTest, AppMessagesBecomeChannelEvents) {
    auto watch = makeDevice(1, "Fenix");
    FakeSdkFactory factory(FakeWearableSdk::InitMode::Ready,
                           [watch](FakeWearableSdk& sdk) { sdk.setDevices({watch}); });
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());
    ASSERT_EQ(session->refreshAndRegisterDevices(), 1u);

    EXPECT_TRUE(factory.last()->emitMessage(watch, {"STARTED", "5", "run", "0"}));
    EXPECT_TRUE(factory.last()->emitMessage(watch, {}));

    auto messages = drainFor<AppMessageReceived>(*session);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].payload, "STARTED|5|run|0");
    EXPECT_EQ(messages[0].receiveTime, 1000);
    EXPECT_EQ(messages[0].device.id, 1);
}

TEST_F(SessionManagerTest, StatusChangesBecomeChannelEvents) {
    auto watch = makeDevice(1, "Fenix");
    FakeSdkFactory factory(FakeWearableSdk::InitMode::Ready,
                           [watch](FakeWearableSdk& sdk) { sdk.setDevices({watch}); });
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());
    session->refreshAndRegisterDevices();

    factory.last()->emitStatus(
        makeDevice(1, "Fenix", device::ConnectionState::NotConnected));
    auto changes = drainFor<DeviceStatusChanged>(*session);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].device.connectionState,
              device::ConnectionState::NotConnected);
}

// ============================================================================
// Recovery
// ============================================================================

TEST_F(SessionManagerTest, VerifyBindingOnHealthyHandle) {
    FakeSdkFactory factory;
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());
    EXPECT_TRUE(session->verifyBinding());
    EXPECT_EQ(session->recoveryCount(), 0u);
}

TEST_F(SessionManagerTest, LostBindingRecreatesHandle) {
    FakeSdkFactory factory;
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());
    auto stale = factory.last();
    stale->bindingLost = true;

    EXPECT_FALSE(session->verifyBinding());
    EXPECT_TRUE(waitUntil([&] {
        return factory.created() == 2u && session->isReady() &&
               !session->isRecovering();
    }));
    EXPECT_EQ(session->recoveryCount(), 1u);
    EXPECT_GE(stale->shutdownCalls.load(), 1);
    EXPECT_TRUE(session->verifyBinding());
}

TEST_F(SessionManagerTest, RecoveryIsSingleFlight) {
    FakeSdkFactory factory;
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());

    factory.setMode(FakeWearableSdk::InitMode::Manual);
    EXPECT_TRUE(session->triggerRecovery());
    EXPECT_FALSE(session->triggerRecovery());
    EXPECT_FALSE(session->triggerRecovery());
    EXPECT_EQ(session->recoveryCount(), 1u);

    ASSERT_TRUE(waitUntil([&] { return factory.created() == 2u; }));
    factory.last()->fireReady();
    EXPECT_TRUE(waitUntil([&] { return !session->isRecovering(); }));
    EXPECT_TRUE(session->isReady());
    EXPECT_EQ(factory.created(), 2u);
}

TEST_F(SessionManagerTest, ConcurrentRecoveryTriggersRunOnce) {
    FakeSdkFactory factory;
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());
    factory.setMode(FakeWearableSdk::InitMode::Manual);

    constexpr int kThreads = 8;
    std::latch go(kThreads);
    std::atomic<int> started{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            go.arrive_and_wait();
            if (session->triggerRecovery()) {
                ++started;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(started.load(), 1);
    EXPECT_EQ(session->recoveryCount(), 1u);
    ASSERT_TRUE(waitUntil([&] { return factory.created() == 2u; }));
    factory.last()->fireReady();
    EXPECT_TRUE(waitUntil([&] { return !session->isRecovering(); }));
    EXPECT_EQ(factory.created(), 2u);
}

TEST_F(SessionManagerTest, RecoveryGuardReleasedAfterTimeout) {
    options_.recoveryTimeout = 50ms;
    FakeSdkFactory factory;
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());

    factory.setMode(FakeWearableSdk::InitMode::Manual);
    EXPECT_TRUE(session->triggerRecovery());
    EXPECT_TRUE(waitUntil([&] { return !session->isRecovering(); }));
    EXPECT_EQ(session->state(), SessionState::Initializing);
    EXPECT_TRUE(session->triggerRecovery());
}

// ============================================================================
// Reset / Close
// ============================================================================

TEST_F(SessionManagerTest, ResetIsIdempotent) {
    FakeSdkFactory factory(FakeWearableSdk::InitMode::Ready, [](FakeWearableSdk& sdk) {
        sdk.setDevices({makeDevice(1, "Fenix")});
    });
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());
    session->refreshAndRegisterDevices();
    auto generation = session->generation();

    EXPECT_NO_THROW(session->reset());
    EXPECT_NO_THROW(session->reset());

    EXPECT_EQ(session->state(), SessionState::Uninitialized);
    EXPECT_EQ(session->handle(), nullptr);
    EXPECT_TRUE(session->registry().empty());
    EXPECT_GT(session->generation(), generation);
    EXPECT_EQ(factory.last()->shutdownCalls.load(), 1);
    EXPECT_EQ(factory.last()->deviceUnregistrations.load(), 1);
    EXPECT_EQ(session->events().size(), 0u);
}

TEST_F(SessionManagerTest, InitAfterResetCreatesFreshHandle) {
    FakeSdkFactory factory;
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());
    session->reset();
    ASSERT_TRUE(session->init().has_value());
    EXPECT_EQ(factory.created(), 2u);
    EXPECT_TRUE(session->isReady());
}

TEST_F(SessionManagerTest, CloseIsTerminal) {
    FakeSdkFactory factory;
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());

    session->close();
    EXPECT_EQ(session->state(), SessionState::ShutDown);
    EXPECT_TRUE(session->events().isClosed());

    auto result = session->init();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SdkErrorCode::ShutDown);
    EXPECT_FALSE(session->triggerRecovery());
    EXPECT_NO_THROW(session->close());
}

TEST_F(SessionManagerTest, StateNames) {
    EXPECT_EQ(sessionStateToString(SessionState::Uninitialized), "Uninitialized");
    EXPECT_EQ(sessionStateToString(SessionState::Ready), "Ready");
    EXPECT_EQ(sessionStateToString(SessionState::ShutDown), "ShutDown");
}

// ============================================================================
// Stuck Initialization
// ============================================================================

TEST_F(SessionManagerTest, WaitForInFlightInitStopsOnToken) {
    options_.initWaitTimeout = 3000ms;
    FakeSdkFactory factory(FakeWearableSdk::InitMode::Manual);
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());

    std::stop_source source;
    std::thread stopper([&source] {
        std::this_thread::sleep_for(50ms);
        source.request_stop();
    });
    auto begin = std::chrono::steady_clock::now();
    auto late = session->init({}, source.get_token());
    stopper.join();

    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1000ms);
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(session->state(), SessionState::Initializing);
    EXPECT_EQ(factory.created(), 1u);
}

TEST_F(SessionManagerTest, AbandonedInitStartsFreshHandle) {
    FakeSdkFactory factory(FakeWearableSdk::InitMode::Manual);
    auto session = makeSession(factory);
    ASSERT_TRUE(session->init().has_value());
    const auto gen = session->generation();

    EXPECT_FALSE(session->abandonInitialization(gen + 1, "wrong generation"));
    EXPECT_EQ(session->state(), SessionState::Initializing);

    EXPECT_TRUE(session->abandonInitialization(gen, "not ready in time"));
    EXPECT_EQ(session->state(), SessionState::Error);
    ASSERT_TRUE(session->lastError().has_value());
    EXPECT_EQ(session->lastError()->code, SdkErrorCode::InitTimeout);
    EXPECT_FALSE(session->abandonInitialization(gen, "again"));

    factory.setMode(FakeWearableSdk::InitMode::Ready);
    ASSERT_TRUE(session->init().has_value());
    EXPECT_TRUE(session->isReady());
    EXPECT_EQ(factory.created(), 2u);
    EXPECT_GT(session->generation(), gen);
}
