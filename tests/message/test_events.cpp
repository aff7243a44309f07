/*
 * test_events.cpp - Tests for relay event types
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "message/events.hpp"

using namespace wristlink::message;

class EventsTest : public ::testing::Test {
protected:
    static constexpr std::int64_t kReceiveTime = 1700000000123;
};

// ============================================================================
// Type Names
// ============================================================================

TEST_F(EventsTest, TypeNames) {
    EXPECT_EQ(payloadTypeName(CreatedEvent{}), "Created");
    EXPECT_EQ(payloadTypeName(TerminatedEvent{}), "Terminated");
    EXPECT_EQ(payloadTypeName(ActivityStartedEvent{}), "ActivityStarted");
    EXPECT_EQ(payloadTypeName(ActivityStoppedEvent{}), "ActivityStopped");
    EXPECT_EQ(payloadTypeName(DeviceConnectedEvent{}), "DeviceConnected");
    EXPECT_EQ(payloadTypeName(DeviceDisconnectedEvent{}), "DeviceDisconnected");
    EXPECT_EQ(payloadTypeName(PongEvent{}), "Pong");
}

TEST_F(EventsTest, AccessorsExposePayload) {
    Event event(ActivityStartedEvent{"Watch", 10, "run"}, kReceiveTime);
    EXPECT_TRUE(event.is<ActivityStartedEvent>());
    EXPECT_FALSE(event.is<ActivityStoppedEvent>());
    EXPECT_EQ(event.as<ActivityStartedEvent>().device, "Watch");
    EXPECT_EQ(event.receiveTime(), kReceiveTime);
    EXPECT_EQ(event.typeName(), "ActivityStarted");
}

// ============================================================================
// JSON Form
// ============================================================================

TEST_F(EventsTest, CreatedJson) {
    Event event(CreatedEvent{42, 2, {"A", "B"}}, kReceiveTime);
    auto j = event.toJson();
    EXPECT_EQ(j["type"], "Created");
    EXPECT_EQ(j["receiveTime"], kReceiveTime);
    EXPECT_EQ(j["startTime"], 42);
    EXPECT_EQ(j["deviceCount"], 2);
    EXPECT_EQ(j["devices"], json::array({"A", "B"}));
}

TEST_F(EventsTest, ActivityStoppedJson) {
    Event event(ActivityStoppedEvent{"Watch", 100, "swim", 60}, kReceiveTime);
    auto j = event.toJson();
    EXPECT_EQ(j["type"], "ActivityStopped");
    EXPECT_EQ(j["device"], "Watch");
    EXPECT_EQ(j["time"], 100);
    EXPECT_EQ(j["activity"], "swim");
    EXPECT_EQ(j["duration"], 60);
}

TEST_F(EventsTest, ActivityStartedJsonHasNoDuration) {
    Event event(ActivityStartedEvent{"Watch", 100, "swim"}, kReceiveTime);
    auto j = event.toJson();
    EXPECT_FALSE(j.contains("duration"));
    EXPECT_EQ(j["activity"], "swim");
}

TEST_F(EventsTest, TerminatedAndPongJson) {
    EXPECT_EQ(Event(TerminatedEvent{"cancelled"}, 0).toJson()["reason"],
              "cancelled");
    EXPECT_EQ(Event(PongEvent{77}, 0).toJson()["startTime"], 77);
    EXPECT_EQ(Event(DeviceConnectedEvent{"W"}, 0).toJson()["device"], "W");
}

// ============================================================================
// History Lines
// ============================================================================

TEST_F(EventsTest, HistoryLineHasClockPrefix) {
    Event event(ActivityStartedEvent{"Watch", 10, "run"}, kReceiveTime);
    auto line = event.toHistoryLine();
    // [HH:MM:SS.mmm]
    ASSERT_GE(line.size(), 15u);
    EXPECT_EQ(line[0], '[');
    EXPECT_EQ(line[13], ']');
    EXPECT_NE(line.find(".123]"), std::string::npos);
    EXPECT_NE(line.find("Watch: STARTED run at 10"), std::string::npos);
}

TEST_F(EventsTest, HistoryLineFallsBackToUnknownDevice) {
    Event event(ActivityStoppedEvent{"", 10, "run", 5}, kReceiveTime);
    EXPECT_NE(event.toHistoryLine().find("unknown device: STOPPED run"),
              std::string::npos);
}

TEST_F(EventsTest, EqualityComparesPayloadAndTime) {
    Event a(PongEvent{1}, 5);
    Event b(PongEvent{1}, 5);
    Event c(PongEvent{1}, 6);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
