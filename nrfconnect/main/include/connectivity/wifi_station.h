#pragma once

#include "provisioning/wifi_interface.h"
#include "runtime/notification.h"

#include <zephyr/net/net_if.h>
#include <zephyr/net/net_mgmt.h>
#include <zephyr/sys/atomic.h>

namespace connectivity
{

/**
 * Station-mode WiFiInterface on the first Zephyr Wi-Fi interface, driven
 * through net_mgmt requests and events.
 */
class WiFiStation : public provisioning::WiFiInterface
{
public:
    static WiFiStation & Instance();

    CHIP_ERROR Enable() override;
    CHIP_ERROR Connect(const provisioning::WiFiCredentials & credentials, runtime::CancelToken & token,
                       provisioning::ConnectionStatus & outcome) override;
    bool IsConnected() override { return atomic_get(&mConnected) != 0; }
    runtime::Notification & LinkChanged() override { return mLinkChanged; }

    CHIP_ERROR WaitInterfaceReady(runtime::CancelToken & token, provisioning::InterfaceAddresses & addresses) override;
    CHIP_ERROR WaitAddressChange(const provisioning::InterfaceAddresses & current, runtime::CancelToken & token) override;

private:
    WiFiStation() = default;

    static void WiFiEventHandler(struct net_mgmt_event_callback * cb, uint64_t event, struct net_if * iface);
    static void AddressEventHandler(struct net_mgmt_event_callback * cb, uint64_t event, struct net_if * iface);

    void ReadAddresses(provisioning::InterfaceAddresses & addresses);
    void Disconnect();

    struct net_if * mIface = nullptr;
    struct net_mgmt_event_callback mWiFiCallback;
    struct net_mgmt_event_callback mIpv6Callback;
    struct net_mgmt_event_callback mIpv4Callback;
    bool mCallbacksAdded = false;

    atomic_t mConnected     = ATOMIC_INIT(0);
    atomic_t mConnectResult = ATOMIC_INIT(0);
    runtime::Notification mConnectDone;
    runtime::Notification mLinkChanged;
    runtime::Notification mAddressChanged;
};

} // namespace connectivity
