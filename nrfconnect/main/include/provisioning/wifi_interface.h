#pragma once

#include "provisioning/wifi_credentials.h"
#include "runtime/cancel_token.h"
#include "runtime/notification.h"

#include <inet/IPAddress.h>
#include <lib/core/CHIPError.h>

namespace provisioning
{

struct InterfaceAddresses
{
    chip::Inet::IPAddress ipv4 = chip::Inet::IPAddress::Any;
    chip::Inet::IPAddress ipv6 = chip::Inet::IPAddress::Any;

    bool operator==(const InterfaceAddresses & other) const { return ipv4 == other.ipv4 && ipv6 == other.ipv6; }
    bool operator!=(const InterfaceAddresses & other) const { return !(*this == other); }
};

/**
 * Station-mode Wi-Fi interface driven by the network manager and the
 * orchestrator.
 */
class WiFiInterface
{
public:
    virtual ~WiFiInterface() = default;

    virtual CHIP_ERROR Enable() = 0;

    // Associates with the given network. A rejected or timed out attempt still
    // returns CHIP_NO_ERROR and describes the failure in `outcome`; errors are
    // reserved for cancellation and platform failures.
    virtual CHIP_ERROR Connect(const WiFiCredentials & credentials, runtime::CancelToken & token,
                               ConnectionStatus & outcome) = 0;
    virtual bool IsConnected() = 0;
    // Raised whenever the link goes up or down.
    virtual runtime::Notification & LinkChanged() = 0;

    // Blocks until the interface has a usable IPv6 address. IPv4 is reported when present.
    virtual CHIP_ERROR WaitInterfaceReady(runtime::CancelToken & token, InterfaceAddresses & addresses) = 0;
    // Returns CHIP_NO_ERROR as soon as the addresses differ from `current`.
    virtual CHIP_ERROR WaitAddressChange(const InterfaceAddresses & current, runtime::CancelToken & token) = 0;
};

} // namespace provisioning
