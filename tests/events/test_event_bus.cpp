/*
 * test_event_bus.cpp - Tests for the broadcast bus
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "events/event_bus.hpp"

using namespace wristlink;
using namespace wristlink::events;

class EventBusTest : public ::testing::Test {
protected:
    static auto pong() -> message::Event {
        return message::Event(message::PongEvent{1}, 10);
    }
    static auto terminated() -> message::Event {
        return message::Event(message::TerminatedEvent{"done"}, 20);
    }

    BroadcastBus bus_;
};

TEST_F(EventBusTest, DeliversToEverySubscriber) {
    int first = 0;
    int second = 0;
    bus_.subscribe([&first](const message::Event&) { ++first; });
    bus_.subscribe([&second](const message::Event&) { ++second; });

    bus_.publish(pong());
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
    EXPECT_EQ(bus_.publishedCount(), 1u);
}

TEST_F(EventBusTest, PublishWithoutSubscribersIsFine) {
    EXPECT_NO_THROW(bus_.publish(pong()));
    EXPECT_EQ(bus_.publishedCount(), 1u);
}

TEST_F(EventBusTest, TypedSubscriptionFilters) {
    std::vector<std::string> seen;
    bus_.subscribe("Terminated", [&seen](const message::Event& event) {
        seen.push_back(event.typeName());
    });

    bus_.publish(pong());
    bus_.publish(terminated());
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "Terminated");
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
    int count = 0;
    auto id = bus_.subscribe([&count](const message::Event&) { ++count; });
    bus_.publish(pong());
    bus_.unsubscribe(id);
    bus_.publish(pong());
    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus_.subscriberCount(), 0u);
}

TEST_F(EventBusTest, ThrowingSubscriberDoesNotBlockOthers) {
    int delivered = 0;
    bus_.subscribe([](const message::Event&) {
        throw std::runtime_error("subscriber failure");
    });
    bus_.subscribe([&delivered](const message::Event&) { ++delivered; });

    EXPECT_NO_THROW(bus_.publish(pong()));
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(bus_.deliveryErrorCount(), 1u);
}

TEST_F(EventBusTest, SubscriberMayUnsubscribeDuringDelivery) {
    SubscriptionId id = 0;
    int count = 0;
    id = bus_.subscribe([this, &id, &count](const message::Event&) {
        ++count;
        bus_.unsubscribe(id);
    });
    bus_.publish(pong());
    bus_.publish(pong());
    EXPECT_EQ(count, 1);
}

TEST_F(EventBusTest, Statistics) {
    bus_.subscribe([](const message::Event&) {});
    bus_.publish(pong());
    auto stats = bus_.getStatistics();
    EXPECT_EQ(stats["subscribers"], 1);
    EXPECT_EQ(stats["published"], 1);
    EXPECT_EQ(stats["deliveryErrors"], 0);
}
