#include "connectivity/ble_manager.h"

#include <lib/support/CodeUtils.h>
#include <platform/ConfigurationManager.h>
#include <platform/internal/BLEManager.h>
#include <zephyr/logging/log.h>
#include <zephyr/sys/printk.h>

LOG_MODULE_DECLARE(netprov_app, LOG_LEVEL_INF);

using namespace chip::DeviceLayer;

namespace connectivity
{

BleCommissioningChannel & BleCommissioningChannel::Instance()
{
    static BleCommissioningChannel sInstance;
    return sInstance;
}

CHIP_ERROR BleCommissioningChannel::StartAdvertising(const char * deviceName)
{
    chip::Ble::ChipBLEDeviceIdentificationInfo idInfo;
    ReturnErrorOnFailure(ConfigurationMgr().GetBLEDeviceIdentificationInfo(idInfo));

    char advName[32];
    snprintk(advName, sizeof(advName), "%s-%03X", deviceName, static_cast<unsigned>(idInfo.GetDeviceDiscriminator()));

    StackLock lock;
    ReturnErrorOnFailure(Internal::BLEMgr().SetDeviceName(advName));
    ReturnErrorOnFailure(ConnectivityMgr().SetBLEAdvertisingEnabled(true));

    LOG_INF("BLE advertising as %s", advName);
    return CHIP_NO_ERROR;
}

void BleCommissioningChannel::StopAdvertising()
{
    StackLock lock;
    CHIP_ERROR err = ConnectivityMgr().SetBLEAdvertisingEnabled(false);
    if (err != CHIP_NO_ERROR)
    {
        LOG_WRN("Failed to stop BLE advertising: %" CHIP_ERROR_FORMAT, err.Format());
    }
}

CHIP_ERROR BleCommissioningChannel::Run(const char * deviceName, runtime::CancelToken & token)
{
    mConnectionClosed.Reset();
    ReturnErrorOnFailure(StartAdvertising(deviceName));

    CHIP_ERROR err = runtime::Wait(mConnectionClosed, token);
    StopAdvertising();
    ReturnErrorOnFailure(err);

    LOG_INF("BLE commissioning connection closed");
    return CHIP_ERROR_CONNECTION_CLOSED_UNEXPECTEDLY;
}

void BleCommissioningChannel::AppEventHandler(const ChipDeviceEvent * event, intptr_t)
{
    switch (event->Type)
    {
    case DeviceEventType::kCHIPoBLEAdvertisingChange:
        LOG_INF("BLE adv change: result=%d enabled=%d adv=%d conns=%u", static_cast<int>(event->CHIPoBLEAdvertisingChange.Result),
                static_cast<int>(Internal::BLEMgr().IsAdvertisingEnabled()), static_cast<int>(Internal::BLEMgr().IsAdvertising()),
                Internal::BLEMgr().NumConnections());
        break;
    case DeviceEventType::kCHIPoBLEConnectionEstablished:
        LOG_INF("BLE connection established");
        break;
    case DeviceEventType::kCHIPoBLEConnectionClosed:
        Instance().mConnectionClosed.Notify();
        break;
    default:
        break;
    }
}

} // namespace connectivity
