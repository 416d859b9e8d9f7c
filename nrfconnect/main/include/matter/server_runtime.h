#pragma once

#include "app/protocol_stack.h"
#include "runtime/notification.h"

#include <platform/CHIPDeviceLayer.h>

namespace matter
{

/**
 * ProtocolStack over chip::Server. Must be initialised after Server::Init()
 * and before the event loop starts.
 */
class ServerRuntime : public ::app::ProtocolStack
{
public:
    static ServerRuntime & Instance();

    CHIP_ERROR Init();

    bool IsCommissioned() override;
    CHIP_ERROR RunResponder(runtime::CancelToken & token) override;
    CHIP_ERROR RunTransport(::app::TransportKind kind, const chip::Optional<::app::CommissioningWindow> & window,
                            runtime::CancelToken & token) override;
    CHIP_ERROR RunDiscoveryBroadcast(const provisioning::InterfaceAddresses & addresses,
                                     runtime::CancelToken & token) override;

private:
    ServerRuntime() = default;

    static void DeviceEventHandler(const chip::DeviceLayer::ChipDeviceEvent * event, intptr_t arg);
    static void ConfigureDynamicMrp();

    CHIP_ERROR OpenCommissioningWindow(::app::TransportKind kind, const ::app::CommissioningWindow & window);

    runtime::Notification mFailSafeExpired;
    runtime::Notification mWindowClosed;
};

} // namespace matter
