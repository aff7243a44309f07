/*
 * test_message_parser.cpp - Tests for the wire message parser
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "message/message_parser.hpp"

using namespace wristlink::message;

class MessageParserTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// ============================================================================
// Activity Codes
// ============================================================================

TEST_F(MessageParserTest, ParsesStartedMessage) {
    auto result = parseMessage("STARTED|1700000000|running|0");
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(std::holds_alternative<ActivityStartedEvent>(*result));

    const auto& event = std::get<ActivityStartedEvent>(*result);
    EXPECT_EQ(event.watchTimeSeconds, 1700000000);
    EXPECT_EQ(event.activityType, "running");
    EXPECT_TRUE(event.device.empty());
}

TEST_F(MessageParserTest, ParsesLongFormStartedCode) {
    auto result = parseMessage("ACTIVITY_STARTED|12|cycling|0");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<ActivityStartedEvent>(*result));
}

TEST_F(MessageParserTest, StartedIgnoresDurationField) {
    auto result = parseMessage("STARTED|5|walk|not-a-number");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<ActivityStartedEvent>(*result),
              (ActivityStartedEvent{"", 5, "walk"}));
}

TEST_F(MessageParserTest, ParsesStoppedMessage) {
    auto result = parseMessage("STOPPED|1700000600|running|600");
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(std::holds_alternative<ActivityStoppedEvent>(*result));

    const auto& event = std::get<ActivityStoppedEvent>(*result);
    EXPECT_EQ(event.watchTimeSeconds, 1700000600);
    EXPECT_EQ(event.activityType, "running");
    EXPECT_EQ(event.durationSeconds, 600);
}

TEST_F(MessageParserTest, ParsesLongFormStoppedCode) {
    auto result = parseMessage("ACTIVITY_STOPPED|1|swim|30");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<ActivityStoppedEvent>(*result).durationSeconds, 30);
}

TEST_F(MessageParserTest, ExtraFieldsAreIgnored) {
    auto result = parseMessage("STOPPED|1|swim|30|extra|fields");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<ActivityStoppedEvent>(*result).activityType, "swim");
}

TEST_F(MessageParserTest, EmptyActivityTypeIsAccepted) {
    auto result = parseMessage("STARTED|1||0");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(std::get<ActivityStartedEvent>(*result).activityType.empty());
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(MessageParserTest, TooFewFieldsIsMalformed) {
    for (const auto* raw : {"", "STARTED", "STARTED|1", "STARTED|1|run"}) {
        auto result = parseMessage(raw);
        ASSERT_FALSE(result.has_value()) << raw;
        EXPECT_EQ(result.error().code, ParseErrorCode::MalformedPayload) << raw;
    }
}

TEST_F(MessageParserTest, UnknownCodeIsRejected) {
    auto result = parseMessage("PAUSED|1|run|0");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::UnknownEventCode);
    EXPECT_NE(result.error().toString().find("PAUSED"), std::string::npos);
}

TEST_F(MessageParserTest, CodeIsCaseSensitive) {
    auto result = parseMessage("started|1|run|0");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::UnknownEventCode);
}

TEST_F(MessageParserTest, NonNumericWatchTimeIsInvalid) {
    auto result = parseMessage("STARTED|abc|run|0");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::InvalidField);
}

TEST_F(MessageParserTest, NegativeNumbersAreInvalid) {
    EXPECT_EQ(parseMessage("STARTED|-1|run|0").error().code,
              ParseErrorCode::InvalidField);
    EXPECT_EQ(parseMessage("STOPPED|1|run|-30").error().code,
              ParseErrorCode::InvalidField);
}

TEST_F(MessageParserTest, TrailingGarbageIsInvalid) {
    EXPECT_FALSE(parseMessage("STOPPED|12x|run|30").has_value());
    EXPECT_FALSE(parseMessage("STOPPED|12|run|30s").has_value());
    EXPECT_FALSE(parseMessage("STOPPED|12|run|").has_value());
}

// ============================================================================
// Joining
// ============================================================================

TEST_F(MessageParserTest, JoinMessageParts) {
    EXPECT_EQ(joinMessageParts({"STARTED", "1", "run", "0"}),
              "STARTED|1|run|0");
    EXPECT_EQ(joinMessageParts({"only"}), "only");
    EXPECT_EQ(joinMessageParts({}), "");
}

TEST_F(MessageParserTest, JoinedPartsParse) {
    auto result = parseMessage(joinMessageParts({"STOPPED", "9", "row", "45"}));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<ActivityStoppedEvent>(*result),
              (ActivityStoppedEvent{"", 9, "row", 45}));
}
