/*
 * sdk_events.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: SDK callbacks as values, consumed by the session worker

**************************************************/

#ifndef WRISTLINK_SDK_SDK_EVENTS_HPP
#define WRISTLINK_SDK_SDK_EVENTS_HPP

#include <cstdint>
#include <string>
#include <variant>

#include "device/device.hpp"
#include "sdk_error.hpp"
#include "utils/event_channel.hpp"

namespace wristlink::sdk {

struct SdkReady {
    std::uint64_t generation{0};
};

struct SdkInitFailed {
    std::uint64_t generation{0};
    SdkError error;
};

struct SdkShutDown {
    std::uint64_t generation{0};
};

struct DeviceStatusChanged {
    device::Device device;
};

struct AppMessageReceived {
    device::Device device;
    std::string payload;  // message objects joined with '|'
    std::int64_t receiveTime{0};
};

using SdkEvent = std::variant<SdkReady, SdkInitFailed, SdkShutDown,
                              DeviceStatusChanged, AppMessageReceived>;

using SdkEventChannel = utils::EventChannel<SdkEvent>;

}  // namespace wristlink::sdk

#endif  // WRISTLINK_SDK_SDK_EVENTS_HPP
