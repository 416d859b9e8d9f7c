#pragma once

#include "app/commissioning_channel.h"
#include "app/protocol_stack.h"
#include "provisioning/wifi_interface.h"
#include "runtime/notification.h"

#include <inet/IPAddress.h>
#include <lib/support/CodeUtils.h>
#include <zephyr/kernel.h>
#include <zephyr/sys/atomic.h>

#include <cstdio>

namespace test
{

// Polls `condition` every 10 ms until it holds or `timeoutMs` elapsed.
template <typename Condition>
bool WaitUntil(Condition condition, int timeoutMs = 3000)
{
    for (int waited = 0; waited < timeoutMs; waited += 10)
    {
        if (condition())
        {
            return true;
        }
        k_sleep(K_MSEC(10));
    }
    return condition();
}

/**
 * Wi-Fi station with a single reachable network. Addresses are link-local
 * fe80::<n>, where n changes on every ChangeAddress().
 */
class FakeWiFi : public provisioning::WiFiInterface
{
public:
    explicit FakeWiFi(const char * reachableSsid = "Home", const char * password = "pw1")
    {
        (void) mReachable.ssid.Set(reachableSsid);
        (void) mReachable.password.Set(password);
    }

    CHIP_ERROR Enable() override
    {
        atomic_inc(&mEnableCalls);
        return CHIP_NO_ERROR;
    }

    CHIP_ERROR Connect(const provisioning::WiFiCredentials & credentials, runtime::CancelToken & token,
                       provisioning::ConnectionStatus & outcome) override
    {
        atomic_inc(&mConnectCalls);
        VerifyOrReturnError(!token.IsCancelled(), CHIP_ERROR_CANCELLED);

        outcome.ssid  = credentials.ssid;
        outcome.value = 0;
        if (credentials.ssid != mReachable.ssid)
        {
            outcome.status = provisioning::NetworkStatus::kNetworkNotFound;
        }
        else if (credentials.password != mReachable.password)
        {
            outcome.status = provisioning::NetworkStatus::kAuthFailure;
        }
        else
        {
            outcome.status = provisioning::NetworkStatus::kSuccess;
            SetConnected(true);
            return CHIP_NO_ERROR;
        }

        // Failed attempts signal a link event too; the manager must not treat
        // its own attempts as a link loss.
        mLinkChanged.Notify();
        return CHIP_NO_ERROR;
    }

    bool IsConnected() override { return atomic_get(&mConnected) != 0; }
    runtime::Notification & LinkChanged() override { return mLinkChanged; }

    CHIP_ERROR WaitInterfaceReady(runtime::CancelToken & token, provisioning::InterfaceAddresses & addresses) override
    {
        while (!IsConnected())
        {
            ReturnErrorOnFailure(runtime::Wait(mAddressChanged, token));
        }
        ReadAddresses(addresses);
        return CHIP_NO_ERROR;
    }

    CHIP_ERROR WaitAddressChange(const provisioning::InterfaceAddresses & current, runtime::CancelToken & token) override
    {
        while (true)
        {
            provisioning::InterfaceAddresses addresses;
            ReadAddresses(addresses);
            if (!IsConnected() || addresses != current)
            {
                return CHIP_NO_ERROR;
            }
            ReturnErrorOnFailure(runtime::Wait(mAddressChanged, token));
        }
    }

    // Addresses are dropped with the link, so a rejoin yields new ones.
    void SetConnected(bool connected)
    {
        if (!connected)
        {
            atomic_inc(&mAddressGeneration);
        }
        atomic_set(&mConnected, connected ? 1 : 0);
        mLinkChanged.Notify();
        mAddressChanged.Notify();
    }

    void ChangeAddress()
    {
        atomic_inc(&mAddressGeneration);
        mAddressChanged.Notify();
    }

    int EnableCalls() { return static_cast<int>(atomic_get(&mEnableCalls)); }
    int ConnectCalls() { return static_cast<int>(atomic_get(&mConnectCalls)); }

private:
    void ReadAddresses(provisioning::InterfaceAddresses & addresses)
    {
        char text[chip::Inet::IPAddress::kMaxStringLength];
        snprintf(text, sizeof(text), "fe80::%x", static_cast<unsigned>(atomic_get(&mAddressGeneration) + 1));

        addresses = provisioning::InterfaceAddresses();
        chip::Inet::IPAddress::FromString(text, addresses.ipv6);
    }

    provisioning::WiFiCredentials mReachable;
    atomic_t mConnected         = ATOMIC_INIT(0);
    atomic_t mEnableCalls       = ATOMIC_INIT(0);
    atomic_t mConnectCalls      = ATOMIC_INIT(0);
    atomic_t mAddressGeneration = ATOMIC_INIT(0);
    runtime::Notification mLinkChanged;
    runtime::Notification mAddressChanged;
};

class FakeChannel : public ::app::CommissioningChannel
{
public:
    CHIP_ERROR Run(const char *, runtime::CancelToken & token) override
    {
        atomic_inc(&mRuns);
        return runtime::WaitCancelled(token);
    }

    int Runs() { return static_cast<int>(atomic_get(&mRuns)); }

private:
    atomic_t mRuns = ATOMIC_INIT(0);
};

class FakeStack : public ::app::ProtocolStack
{
public:
    bool IsCommissioned() override { return atomic_get(&mCommissioned) != 0; }
    void SetCommissioned(bool commissioned) { atomic_set(&mCommissioned, commissioned ? 1 : 0); }

    // Ends with CHIP_ERROR_TIMEOUT once ExpireFailSafe() is called, like the
    // server does when an armed fail-safe runs out.
    CHIP_ERROR RunResponder(runtime::CancelToken & token) override
    {
        atomic_inc(&mResponderRuns);
        ReturnErrorOnFailure(runtime::Wait(mFailSafeExpired, token));
        return CHIP_ERROR_TIMEOUT;
    }

    void ExpireFailSafe() { mFailSafeExpired.Notify(); }

    CHIP_ERROR RunTransport(::app::TransportKind kind, const chip::Optional<::app::CommissioningWindow> & window,
                            runtime::CancelToken & token) override
    {
        if (kind == ::app::TransportKind::kBle && window.HasValue())
        {
            atomic_inc(&mBleTransportRuns);
        }
        else if (kind == ::app::TransportKind::kNetwork && !window.HasValue())
        {
            atomic_inc(&mNetworkTransportRuns);
        }
        return runtime::WaitCancelled(token);
    }

    CHIP_ERROR RunDiscoveryBroadcast(const provisioning::InterfaceAddresses &, runtime::CancelToken & token) override
    {
        atomic_inc(&mDiscoveryRuns);
        return runtime::WaitCancelled(token);
    }

    int BleTransportRuns() { return static_cast<int>(atomic_get(&mBleTransportRuns)); }
    int NetworkTransportRuns() { return static_cast<int>(atomic_get(&mNetworkTransportRuns)); }
    int DiscoveryRuns() { return static_cast<int>(atomic_get(&mDiscoveryRuns)); }
    int ResponderRuns() { return static_cast<int>(atomic_get(&mResponderRuns)); }

private:
    runtime::Notification mFailSafeExpired;
    atomic_t mCommissioned         = ATOMIC_INIT(0);
    atomic_t mResponderRuns        = ATOMIC_INIT(0);
    atomic_t mBleTransportRuns     = ATOMIC_INIT(0);
    atomic_t mNetworkTransportRuns = ATOMIC_INIT(0);
    atomic_t mDiscoveryRuns        = ATOMIC_INIT(0);
};

} // namespace test
