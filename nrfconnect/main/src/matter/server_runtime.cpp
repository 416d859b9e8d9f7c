#include "matter/server_runtime.h"

#include <app/server/CommissioningWindowManager.h>
#include <app/server/Dnssd.h>
#include <app/server/Server.h>
#include <inet/IPAddress.h>
#include <lib/support/CodeUtils.h>
#include <lib/support/logging/CHIPLogging.h>
#include <messaging/ReliableMessageProtocolConfig.h>

#if CHIP_DEVICE_CONFIG_ENABLE_DYNAMIC_MRP_CONFIG
#include <lib/core/Optional.h>
#include <system/SystemClock.h>
#endif

using namespace chip;
using namespace chip::DeviceLayer;

namespace matter
{

ServerRuntime & ServerRuntime::Instance()
{
    static ServerRuntime sInstance;
    return sInstance;
}

CHIP_ERROR ServerRuntime::Init()
{
    ReturnErrorOnFailure(PlatformMgr().AddEventHandler(DeviceEventHandler, reinterpret_cast<intptr_t>(this)));
    ConfigureDynamicMrp();
    return CHIP_NO_ERROR;
}

void ServerRuntime::ConfigureDynamicMrp()
{
#if CHIP_DEVICE_CONFIG_ENABLE_DYNAMIC_MRP_CONFIG
    // Longer idle interval for the BLE commissioning link.
    using namespace chip::System::Clock::Literals;
    Messaging::ReliableMessageProtocolConfig mrpConfig(2000_ms32, 300_ms32);
    if (Messaging::ReliableMessageProtocolConfig::SetLocalMRPConfig(MakeOptional(mrpConfig)))
    {
        ChipLogProgress(AppServer, "Local MRP config updated");
    }
#endif
}

void ServerRuntime::DeviceEventHandler(const ChipDeviceEvent * event, intptr_t arg)
{
    auto * self = reinterpret_cast<ServerRuntime *>(arg);

    switch (event->Type)
    {
    case DeviceEventType::kFailSafeTimerExpired:
        ChipLogProgress(AppServer, "Fail-safe expired for fabric %u",
                        static_cast<unsigned>(event->FailSafeTimerExpired.fabricIndex));
        self->mFailSafeExpired.Notify();
        break;
    case DeviceEventType::kCommissioningWindowClosed:
        ChipLogProgress(AppServer, "Commissioning window closed");
        self->mWindowClosed.Notify();
        break;
    case DeviceEventType::kCommissioningComplete:
        ChipLogProgress(AppServer, "Commissioning complete for fabric %u",
                        static_cast<unsigned>(event->CommissioningComplete.fabricIndex));
        break;
    default:
        break;
    }
}

bool ServerRuntime::IsCommissioned()
{
    StackLock lock;
    return Server::GetInstance().GetFabricTable().FabricCount() > 0;
}

CHIP_ERROR ServerRuntime::RunResponder(runtime::CancelToken & token)
{
    // Sessions are served by the event loop; what ends a responder is a
    // commissioning attempt that ran out of time.
    mFailSafeExpired.Reset();

    CHIP_ERROR err = runtime::Wait(mFailSafeExpired, token);
    ReturnErrorOnFailure(err);

    ChipLogError(AppServer, "Responder stopped: fail-safe expired");
    return CHIP_ERROR_TIMEOUT;
}

CHIP_ERROR ServerRuntime::OpenCommissioningWindow(::app::TransportKind kind, const ::app::CommissioningWindow & window)
{
    StackLock lock;
    CommissioningWindowManager & manager = Server::GetInstance().GetCommissioningWindowManager();

    VerifyOrReturnError(!manager.IsCommissioningWindowOpen(), CHIP_NO_ERROR);

    CommissioningWindowAdvertisement advertisement = kind == ::app::TransportKind::kBle
        ? CommissioningWindowAdvertisement::kAllSupported
        : CommissioningWindowAdvertisement::kDnssdOnly;

    CHIP_ERROR err = manager.OpenBasicCommissioningWindow(window.timeout, advertisement);
    if (err != CHIP_NO_ERROR)
    {
        ChipLogError(AppServer, "Failed to open commissioning window: %s", ErrorStr(err));
        return err;
    }

    ChipLogProgress(AppServer, "Commissioning window open for %u s", static_cast<unsigned>(window.timeout.count()));
    return CHIP_NO_ERROR;
}

CHIP_ERROR ServerRuntime::RunTransport(::app::TransportKind kind, const Optional<::app::CommissioningWindow> & window,
                                       runtime::CancelToken & token)
{
    if (!window.HasValue())
    {
        {
            StackLock lock;
            Server::GetInstance().RejoinExistingMulticastGroups();
        }
        return runtime::WaitCancelled(token);
    }

    mWindowClosed.Reset();
    ReturnErrorOnFailure(OpenCommissioningWindow(kind, window.Value()));

    // A cancelled transport leaves the window to its own timeout; tearing it
    // down here would drop the PASE session a ConnectNetwork arrived on.
    ReturnErrorOnFailure(runtime::Wait(mWindowClosed, token));
    return CHIP_ERROR_TIMEOUT;
}

CHIP_ERROR ServerRuntime::RunDiscoveryBroadcast(const provisioning::InterfaceAddresses & addresses,
                                                runtime::CancelToken & token)
{
    char ipv6[Inet::IPAddress::kMaxStringLength];
    char ipv4[Inet::IPAddress::kMaxStringLength];
    addresses.ipv6.ToString(ipv6, sizeof(ipv6));
    addresses.ipv4.ToString(ipv4, sizeof(ipv4));
    ChipLogProgress(AppServer, "Advertising operational service on %s / %s", ipv6, ipv4);

    {
        StackLock lock;
        chip::app::DnssdServer::Instance().StartServer();
    }

    return runtime::WaitCancelled(token);
}

} // namespace matter
