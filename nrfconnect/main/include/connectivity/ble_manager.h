#pragma once

#include "app/commissioning_channel.h"
#include "runtime/notification.h"

#include <platform/CHIPDeviceLayer.h>

namespace connectivity
{

/**
 * CHIPoBLE as the commissioning channel. The advertised name is the device
 * name followed by the setup discriminator.
 */
class BleCommissioningChannel : public ::app::CommissioningChannel
{
public:
    static BleCommissioningChannel & Instance();

    CHIP_ERROR Run(const char * deviceName, runtime::CancelToken & token) override;

    static void AppEventHandler(const chip::DeviceLayer::ChipDeviceEvent * event, intptr_t arg);

private:
    BleCommissioningChannel() = default;

    CHIP_ERROR StartAdvertising(const char * deviceName);
    void StopAdvertising();

    runtime::Notification mConnectionClosed;
};

} // namespace connectivity
