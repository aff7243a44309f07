/*
 * test_event_dispatcher.cpp - Tests for message dispatch and notifications
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <vector>

#include "events/event_dispatcher.hpp"

using namespace wristlink;
using namespace wristlink::events;

namespace {

class RecordingSink : public NotificationSink {
public:
    void update(const Notification& notification) override {
        std::lock_guard lock(mutex_);
        updates.push_back(notification);
    }

    auto latest() -> Notification {
        std::lock_guard lock(mutex_);
        return updates.empty() ? Notification{} : updates.back();
    }

    std::vector<Notification> updates;

private:
    std::mutex mutex_;
};

}  // namespace

class EventDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<RecordingSink>();
        dispatcher_ = std::make_unique<EventDispatcher>(
            bus_, sink_, 3, [] { return std::int64_t{5000}; });
        bus_.subscribe(
            [this](const message::Event& event) { events_.push_back(event); });
    }

    BroadcastBus bus_;
    std::shared_ptr<RecordingSink> sink_;
    std::unique_ptr<EventDispatcher> dispatcher_;
    std::vector<message::Event> events_;
};

// ============================================================================
// Messages
// ============================================================================

TEST_F(EventDispatcherTest, ValidMessageIsPublishedWithDevice) {
    EXPECT_TRUE(dispatcher_->onMessage("STARTED|100|run|0", "Fenix", 1234));

    ASSERT_EQ(events_.size(), 1u);
    const auto& event = events_[0];
    ASSERT_TRUE(event.is<message::ActivityStartedEvent>());
    EXPECT_EQ(event.as<message::ActivityStartedEvent>().device, "Fenix");
    EXPECT_EQ(event.receiveTime(), 1234);

    EXPECT_EQ(dispatcher_->historyLines().size(), 1u);
    ASSERT_TRUE(dispatcher_->lastMessage().has_value());
    EXPECT_NE(dispatcher_->lastMessage()->find("Fenix: STARTED run"),
              std::string::npos);
}

TEST_F(EventDispatcherTest, InvalidMessageIsDropped) {
    EXPECT_FALSE(dispatcher_->onMessage("garbage", "Fenix", 1));
    EXPECT_FALSE(dispatcher_->onMessage("PAUSED|1|run|0", "Fenix", 1));
    EXPECT_TRUE(events_.empty());
    EXPECT_TRUE(dispatcher_->historyLines().empty());
    EXPECT_EQ(dispatcher_->droppedCount(), 2u);
}

TEST_F(EventDispatcherTest, NotificationShowsLastMessage) {
    dispatcher_->resetDevices(device::toDeviceSet(
        {{1, "Fenix", device::ConnectionState::Connected}}));
    dispatcher_->onMessage("STOPPED|100|run|60", "Fenix", 1);

    auto notification = sink_->latest();
    EXPECT_EQ(notification.contentText, "Listening - 1 device(s) connected");
    EXPECT_NE(notification.bigText.find("Fenix\nLast: "), std::string::npos);
}

// ============================================================================
// Devices
// ============================================================================

TEST_F(EventDispatcherTest, DeviceChangesArePublished) {
    device::Device a{1, "A", device::ConnectionState::Connected};
    device::Device b{2, "B", device::ConnectionState::Connected};
    dispatcher_->onDeviceChange({a, b}, {});
    dispatcher_->onDeviceChange({}, {a});

    ASSERT_EQ(events_.size(), 3u);
    EXPECT_TRUE(events_[0].is<message::DeviceConnectedEvent>());
    EXPECT_TRUE(events_[1].is<message::DeviceConnectedEvent>());
    EXPECT_TRUE(events_[2].is<message::DeviceDisconnectedEvent>());
    EXPECT_EQ(events_[2].as<message::DeviceDisconnectedEvent>().device, "A");
    EXPECT_EQ(dispatcher_->connectedDevices(), (std::vector<std::string>{"B"}));
}

TEST_F(EventDispatcherTest, ResetDevicesPublishesNothing) {
    dispatcher_->resetDevices(device::toDeviceSet(
        {{1, "A", device::ConnectionState::Connected}}));
    EXPECT_TRUE(events_.empty());
    EXPECT_EQ(dispatcher_->connectedDevices().size(), 1u);
    EXPECT_EQ(sink_->latest().contentText, "Listening - 1 device(s) connected");
}

TEST_F(EventDispatcherTest, NoDevicesNotification) {
    dispatcher_->resetDevices({});
    EXPECT_EQ(sink_->latest().contentText, "Listening - no devices connected");
    EXPECT_EQ(sink_->latest().bigText, "Listening - no devices connected");
}

// ============================================================================
// Publishing / History
// ============================================================================

TEST_F(EventDispatcherTest, PublishStampsWithClock) {
    auto event = dispatcher_->publish(message::TerminatedEvent{"cancelled"});
    EXPECT_EQ(event.receiveTime(), 5000);
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0], event);
}

TEST_F(EventDispatcherTest, PongIsNotRecorded) {
    dispatcher_->publish(message::PongEvent{1});
    EXPECT_EQ(events_.size(), 1u);
    EXPECT_TRUE(dispatcher_->historyLines().empty());
}

TEST_F(EventDispatcherTest, HistoryIsBounded) {
    for (int i = 0; i < 5; ++i) {
        dispatcher_->onMessage("STARTED|" + std::to_string(i) + "|run|0", "W",
                               i);
    }
    auto lines = dispatcher_->historyLines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_NE(lines.front().find("at 2"), std::string::npos);
    EXPECT_NE(lines.back().find("at 4"), std::string::npos);
}

TEST_F(EventDispatcherTest, ClearHistoryForgetsLastMessage) {
    dispatcher_->onMessage("STARTED|1|run|0", "W", 1);
    dispatcher_->clearHistory();
    EXPECT_TRUE(dispatcher_->history().empty());
    EXPECT_FALSE(dispatcher_->lastMessage().has_value());
}

TEST_F(EventDispatcherTest, MarkStoppedUpdatesNotification) {
    dispatcher_->resetDevices(device::toDeviceSet(
        {{1, "A", device::ConnectionState::Connected}}));
    dispatcher_->markStopped();
    EXPECT_EQ(sink_->latest().contentText, "Stopped");
    EXPECT_TRUE(dispatcher_->connectedDevices().empty());
}

// ============================================================================
// Notification Formatting
// ============================================================================

TEST(NotificationFormatTest, ListsDevicesThenLastLine) {
    auto n = formatNotification({"A", "B"}, std::string("[t] msg"), false);
    EXPECT_EQ(n.contentText, "Listening - 2 device(s) connected");
    EXPECT_EQ(n.bigText, "A\nB\nLast: [t] msg");
}

TEST(NotificationFormatTest, LogSinkKeepsCurrent) {
    LogNotificationSink sink;
    Notification n{"Stopped", "Stopped"};
    sink.update(n);
    sink.update(n);
    EXPECT_EQ(sink.current(), n);
}
