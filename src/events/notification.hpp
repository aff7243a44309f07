/*
 * notification.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Status notification text and the sink it is pushed to

**************************************************/

#ifndef WRISTLINK_EVENTS_NOTIFICATION_HPP
#define WRISTLINK_EVENTS_NOTIFICATION_HPP

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wristlink::events {

struct Notification {
    std::string contentText;
    std::string bigText;

    bool operator==(const Notification&) const = default;
};

/**
 * @brief Build the notification for the current device list.
 *
 * @param devices labels of connected real devices
 * @param lastLine history line of the last received message, if any
 * @param stopped the listener has terminated
 */
[[nodiscard]] auto formatNotification(const std::vector<std::string>& devices,
                                      const std::optional<std::string>& lastLine,
                                      bool stopped) -> Notification;

/**
 * @brief Notification surface
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void update(const Notification& notification) = 0;
};

/**
 * @brief Writes notifications to the log when they change
 */
class LogNotificationSink : public NotificationSink {
public:
    void update(const Notification& notification) override;

    [[nodiscard]] auto current() const -> Notification;

private:
    mutable std::mutex mutex_;
    std::optional<Notification> last_;
};

}  // namespace wristlink::events

#endif  // WRISTLINK_EVENTS_NOTIFICATION_HPP
