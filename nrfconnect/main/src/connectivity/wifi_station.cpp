#include "connectivity/wifi_station.h"

#include "matter/wifi_commissioning_cluster.h"

#include <lib/support/CodeUtils.h>
#include <system/SystemError.h>
#include <zephyr/logging/log.h>
#include <zephyr/net/wifi_mgmt.h>

#include <cerrno>

LOG_MODULE_DECLARE(netprov_app, LOG_LEVEL_INF);

using provisioning::ConnectionStatus;
using provisioning::InterfaceAddresses;
using provisioning::NetworkStatus;

namespace connectivity
{

namespace
{

constexpr uint64_t kWiFiEvents = NET_EVENT_WIFI_CONNECT_RESULT | NET_EVENT_WIFI_DISCONNECT_RESULT;
constexpr uint64_t kIpv6Events = NET_EVENT_IPV6_ADDR_ADD | NET_EVENT_IPV6_ADDR_DEL;
constexpr uint64_t kIpv4Events = NET_EVENT_IPV4_ADDR_ADD | NET_EVENT_IPV4_ADDR_DEL;

NetworkStatus MapConnectStatus(int status)
{
    switch (status)
    {
    case WIFI_STATUS_CONN_SUCCESS:
        return NetworkStatus::kSuccess;
    case WIFI_STATUS_CONN_WRONG_PASSWORD:
        return NetworkStatus::kAuthFailure;
    case WIFI_STATUS_CONN_AP_NOT_FOUND:
        return NetworkStatus::kNetworkNotFound;
    default:
        return NetworkStatus::kOtherConnectionFailure;
    }
}

} // namespace

WiFiStation & WiFiStation::Instance()
{
    static WiFiStation sInstance;
    return sInstance;
}

CHIP_ERROR WiFiStation::Enable()
{
    if (mIface == nullptr)
    {
        mIface = net_if_get_first_wifi();
        VerifyOrReturnError(mIface != nullptr, CHIP_ERROR_INCORRECT_STATE, LOG_ERR("No Wi-Fi interface"));
    }

    if (!mCallbacksAdded)
    {
        net_mgmt_init_event_callback(&mWiFiCallback, WiFiEventHandler, kWiFiEvents);
        net_mgmt_init_event_callback(&mIpv6Callback, AddressEventHandler, kIpv6Events);
        net_mgmt_init_event_callback(&mIpv4Callback, AddressEventHandler, kIpv4Events);
        net_mgmt_add_event_callback(&mWiFiCallback);
        net_mgmt_add_event_callback(&mIpv6Callback);
        net_mgmt_add_event_callback(&mIpv4Callback);
        mCallbacksAdded = true;
    }

    int rc = net_if_up(mIface);
    if (rc != 0 && rc != -EALREADY)
    {
        LOG_ERR("net_if_up failed: %d", rc);
        return chip::System::MapErrorZephyr(rc);
    }
    return CHIP_NO_ERROR;
}

void WiFiStation::WiFiEventHandler(struct net_mgmt_event_callback * cb, uint64_t event, struct net_if *)
{
    WiFiStation & self = Instance();
    atomic_val_t previous;

    if (event == NET_EVENT_WIFI_CONNECT_RESULT)
    {
        const auto * status = static_cast<const struct wifi_status *>(cb->info);
        int result          = status != nullptr ? status->status : WIFI_STATUS_CONN_FAIL;

        atomic_set(&self.mConnectResult, result);
        previous = atomic_set(&self.mConnected, result == WIFI_STATUS_CONN_SUCCESS ? 1 : 0);
        self.mConnectDone.Notify();
    }
    else if (event == NET_EVENT_WIFI_DISCONNECT_RESULT)
    {
        previous = atomic_set(&self.mConnected, 0);
    }
    else
    {
        return;
    }

    // A failed association while already down is not a link change.
    if (previous == atomic_get(&self.mConnected))
    {
        return;
    }

    LOG_INF("Wi-Fi link %s", previous != 0 ? "down" : "up");
    self.mLinkChanged.Notify();
    self.mAddressChanged.Notify();
}

void WiFiStation::AddressEventHandler(struct net_mgmt_event_callback *, uint64_t, struct net_if * iface)
{
    WiFiStation & self = Instance();
    if (iface == self.mIface)
    {
        self.mAddressChanged.Notify();
    }
}

void WiFiStation::Disconnect()
{
    int rc = net_mgmt(NET_REQUEST_WIFI_DISCONNECT, mIface, nullptr, 0);
    if (rc != 0 && rc != -EALREADY)
    {
        LOG_WRN("Wi-Fi disconnect failed: %d", rc);
    }
}

CHIP_ERROR WiFiStation::Connect(const provisioning::WiFiCredentials & credentials, runtime::CancelToken & token,
                                ConnectionStatus & outcome)
{
    VerifyOrReturnError(mIface != nullptr, CHIP_ERROR_INCORRECT_STATE);

    if (IsConnected())
    {
        Disconnect();
    }

    struct wifi_connect_req_params params = {};
    params.ssid                           = credentials.ssid.Span().data();
    params.ssid_length                    = credentials.ssid.Length();
    params.psk                            = credentials.password.Span().data();
    params.psk_length                     = credentials.password.Length();
    params.security    = credentials.password.Empty() ? WIFI_SECURITY_TYPE_NONE : WIFI_SECURITY_TYPE_PSK;
    params.channel     = WIFI_CHANNEL_ANY;
    params.mfp         = WIFI_MFP_OPTIONAL;
    params.timeout     = SYS_FOREVER_MS;

    outcome.ssid = credentials.ssid;

    mConnectDone.Reset();
    int rc = net_mgmt(NET_REQUEST_WIFI_CONNECT, mIface, &params, sizeof(params));
    if (rc != 0)
    {
        LOG_ERR("Wi-Fi connect request rejected: %d", rc);
        return chip::System::MapErrorZephyr(rc);
    }

    CHIP_ERROR err =
        runtime::Wait(mConnectDone, token, K_SECONDS(matter::WiFiCommissioningCluster::kConnectMaxTimeSeconds));
    if (err == CHIP_ERROR_TIMEOUT)
    {
        Disconnect();
        outcome.status = NetworkStatus::kOtherConnectionFailure;
        outcome.value  = -ETIMEDOUT;
        return CHIP_NO_ERROR;
    }
    if (err != CHIP_NO_ERROR)
    {
        Disconnect();
        return err;
    }

    int result     = static_cast<int>(atomic_get(&mConnectResult));
    outcome.status = MapConnectStatus(result);
    outcome.value  = result;
    return CHIP_NO_ERROR;
}

void WiFiStation::ReadAddresses(InterfaceAddresses & addresses)
{
    addresses = InterfaceAddresses();

    struct in6_addr * ipv6 = net_if_ipv6_get_ll(mIface, NET_ADDR_PREFERRED);
    if (ipv6 != nullptr)
    {
        addresses.ipv6 = chip::Inet::IPAddress(*ipv6);
    }

    struct in_addr * ipv4 = net_if_ipv4_get_global_addr(mIface, NET_ADDR_PREFERRED);
    if (ipv4 != nullptr)
    {
        addresses.ipv4 = chip::Inet::IPAddress(*ipv4);
    }
}

CHIP_ERROR WiFiStation::WaitInterfaceReady(runtime::CancelToken & token, InterfaceAddresses & addresses)
{
    VerifyOrReturnError(mIface != nullptr, CHIP_ERROR_INCORRECT_STATE);

    while (true)
    {
        ReadAddresses(addresses);
        if (IsConnected() && addresses.ipv6 != chip::Inet::IPAddress::Any)
        {
            return CHIP_NO_ERROR;
        }
        ReturnErrorOnFailure(runtime::Wait(mAddressChanged, token));
    }
}

CHIP_ERROR WiFiStation::WaitAddressChange(const InterfaceAddresses & current, runtime::CancelToken & token)
{
    VerifyOrReturnError(mIface != nullptr, CHIP_ERROR_INCORRECT_STATE);

    while (true)
    {
        InterfaceAddresses addresses;
        ReadAddresses(addresses);
        if (!IsConnected() || addresses != current)
        {
            return CHIP_NO_ERROR;
        }
        ReturnErrorOnFailure(runtime::Wait(mAddressChanged, token));
    }
}

} // namespace connectivity
