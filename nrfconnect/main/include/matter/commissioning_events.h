#pragma once

#include <platform/CHIPDeviceEvent.h>

namespace matter
{

// True for device events after which the commissioning session that carried
// a ConnectNetwork is gone or no longer expects an answer.
inline bool EndsCommissioningSession(const chip::DeviceLayer::ChipDeviceEvent & event)
{
    using chip::DeviceLayer::DeviceEventType::kCHIPoBLEConnectionClosed;
    using chip::DeviceLayer::DeviceEventType::kCommissioningComplete;
    using chip::DeviceLayer::DeviceEventType::kCommissioningWindowClosed;
    using chip::DeviceLayer::DeviceEventType::kFailSafeTimerExpired;

    switch (event.Type)
    {
    case kFailSafeTimerExpired:
    case kCommissioningWindowClosed:
    case kCommissioningComplete:
    case kCHIPoBLEConnectionClosed:
        return true;
    default:
        return false;
    }
}

} // namespace matter
