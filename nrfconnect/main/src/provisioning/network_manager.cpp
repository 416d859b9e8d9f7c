#include "provisioning/network_manager.h"

#include <lib/support/CodeUtils.h>
#include <zephyr/logging/log.h>

LOG_MODULE_DECLARE(netprov_app, LOG_LEVEL_INF);

namespace provisioning
{

namespace
{

const char * StateName(NetworkManager::State state)
{
    switch (state)
    {
    case NetworkManager::State::kIdle:
        return "idle";
    case NetworkManager::State::kConnecting:
        return "connecting";
    case NetworkManager::State::kConnected:
        return "connected";
    case NetworkManager::State::kFailed:
        return "failed";
    }
    return "?";
}

} // namespace

NetworkManager::NetworkManager(NetworkContext & context, WiFiInterface & wifi) : mContext(context), mWiFi(wifi)
{
    atomic_set(&mState, static_cast<atomic_val_t>(State::kIdle));
}

void NetworkManager::SetState(State state)
{
    State previous = static_cast<State>(atomic_set(&mState, static_cast<atomic_val_t>(state)));
    if (previous != state)
    {
        LOG_DBG("Network manager: %s -> %s", StateName(previous), StateName(state));
    }
}

CHIP_ERROR NetworkManager::Run(runtime::CancelToken & token)
{
    bool reconnectDue = true;

    while (true)
    {
        // The wake-up may have fired before this loop started waiting, so the
        // request is always looked up in the context rather than inferred.
        Ssid requested;
        if (mContext.TakeConnectRequest(requested))
        {
            ReturnErrorOnFailure(HandleConnectRequest(requested, token));
            mWiFi.LinkChanged().Reset();
        }
        else if (reconnectDue && !mWiFi.IsConnected())
        {
            ReturnErrorOnFailure(ReconnectKnownNetworks(token));
            mWiFi.LinkChanged().Reset();
        }
        reconnectDue = false;

        // Link events caused by our own attempts were dropped above. The link
        // state is read after that, so the timeout still covers a later drop.
        runtime::Notification * wake[] = { &mContext.ConnectRequested(), &mWiFi.LinkChanged() };
        k_timeout_t timeout = mWiFi.IsConnected() ? K_FOREVER : K_MSEC(CONFIG_NETPROV_RECONNECT_INTERVAL_MS);

        CHIP_ERROR err = runtime::WaitAny(wake, chip::ArraySize(wake), token, timeout);
        if (err == CHIP_ERROR_TIMEOUT)
        {
            reconnectDue = true;
            continue;
        }
        ReturnErrorOnFailure(err);

        reconnectDue = !mContext.HasConnectRequest();
    }
}

CHIP_ERROR NetworkManager::HandleConnectRequest(const Ssid & ssid, runtime::CancelToken & token)
{
    WiFiCredentials credentials;
    bool known = false;

    SetState(State::kConnecting);

    {
        auto state = mContext.Lock();
        size_t index;
        known = state->networks.Find(ssid.Span(), index);
        if (known)
        {
            credentials = state->networks[index];
        }
    }

    ConnectionStatus outcome;
    if (known)
    {
        ReturnErrorOnFailure(Attempt(credentials, token, outcome));
    }
    else
    {
        LOG_WRN("Connect requested for unknown network %s", ssid.c_str());
        outcome.ssid   = ssid;
        outcome.status = NetworkStatus::kNetworkIDNotFound;
        outcome.value  = 0;
    }

    mContext.SetStatus(outcome);
    SetState(outcome.status == NetworkStatus::kSuccess ? State::kConnected : State::kFailed);
    SetState(State::kIdle);
    return CHIP_NO_ERROR;
}

CHIP_ERROR NetworkManager::ReconnectKnownNetworks(runtime::CancelToken & token)
{
    NetworkList networks;
    {
        auto state = mContext.Lock();
        networks   = state->networks;
    }
    VerifyOrReturnError(!networks.Empty(), CHIP_NO_ERROR);

    for (const auto & credentials : networks)
    {
        ConnectionStatus outcome;

        SetState(State::kConnecting);
        ReturnErrorOnFailure(Attempt(credentials, token, outcome));
        mContext.SetStatus(outcome);

        if (outcome.status == NetworkStatus::kSuccess)
        {
            SetState(State::kConnected);
            SetState(State::kIdle);
            return CHIP_NO_ERROR;
        }
        SetState(State::kFailed);
    }

    SetState(State::kIdle);
    LOG_WRN("No known network reachable, retrying in %u ms", static_cast<unsigned>(CONFIG_NETPROV_RECONNECT_INTERVAL_MS));
    return CHIP_NO_ERROR;
}

CHIP_ERROR NetworkManager::Attempt(const WiFiCredentials & credentials, runtime::CancelToken & token,
                                   ConnectionStatus & outcome)
{
    LOG_INF("Connecting to %s", credentials.ssid.c_str());

    CHIP_ERROR err = mWiFi.Connect(credentials, token, outcome);
    VerifyOrReturnError(err != CHIP_ERROR_CANCELLED, err);

    if (err != CHIP_NO_ERROR)
    {
        LOG_ERR("Wi-Fi connect failed: %" CHIP_ERROR_FORMAT, err.Format());
        outcome.ssid   = credentials.ssid;
        outcome.status = NetworkStatus::kOtherConnectionFailure;
        outcome.value  = static_cast<int32_t>(err.AsInteger());
    }
    else if (outcome.status != NetworkStatus::kSuccess)
    {
        LOG_WRN("Association with %s failed: status %u, value %d", credentials.ssid.c_str(),
                static_cast<unsigned>(outcome.status), static_cast<int>(outcome.value));
    }
    else
    {
        LOG_INF("Connected to %s", credentials.ssid.c_str());
    }

    return CHIP_NO_ERROR;
}

} // namespace provisioning
