/*
 * notification.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "notification.hpp"

#include <spdlog/spdlog.h>

namespace wristlink::events {

auto formatNotification(const std::vector<std::string>& devices,
                        const std::optional<std::string>& lastLine,
                        bool stopped) -> Notification {
    Notification n;
    if (stopped) {
        n.contentText = "Stopped";
    } else if (devices.empty()) {
        n.contentText = "Listening - no devices connected";
    } else {
        n.contentText = fmt::format("Listening - {} device(s) connected",
                                    devices.size());
    }

    for (const auto& dev : devices) {
        if (!n.bigText.empty()) {
            n.bigText += '\n';
        }
        n.bigText += dev;
    }
    if (lastLine) {
        if (!n.bigText.empty()) {
            n.bigText += '\n';
        }
        n.bigText += "Last: " + *lastLine;
    }
    if (n.bigText.empty()) {
        n.bigText = n.contentText;
    }
    return n;
}

void LogNotificationSink::update(const Notification& notification) {
    {
        std::lock_guard lock(mutex_);
        if (last_ && *last_ == notification) {
            return;
        }
        last_ = notification;
    }
    spdlog::info("[NOTIFY] {}", notification.contentText);
    spdlog::debug("[NOTIFY] {}", notification.bigText);
}

auto LogNotificationSink::current() const -> Notification {
    std::lock_guard lock(mutex_);
    return last_.value_or(Notification{});
}

}  // namespace wristlink::events
