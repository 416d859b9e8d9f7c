#pragma once

#include "provisioning/network_context.h"
#include "provisioning/wifi_interface.h"
#include "runtime/task.h"

#include <lib/core/CHIPError.h>
#include <zephyr/sys/atomic.h>

namespace provisioning
{

/**
 * Turns connect requests into association attempts and keeps the station
 * joined to a known network when the link drops. Sole writer of the
 * connection status in NetworkContext.
 */
class NetworkManager : public runtime::Task
{
public:
    enum class State : uint8_t
    {
        kIdle,
        kConnecting,
        kConnected,
        kFailed,
    };

    NetworkManager(NetworkContext & context, WiFiInterface & wifi);

    const char * Name() const override { return "wifi-mgr"; }
    CHIP_ERROR Run(runtime::CancelToken & token) override;

    State GetState() { return static_cast<State>(atomic_get(&mState)); }

private:
    CHIP_ERROR HandleConnectRequest(const Ssid & ssid, runtime::CancelToken & token);
    CHIP_ERROR ReconnectKnownNetworks(runtime::CancelToken & token);
    CHIP_ERROR Attempt(const WiFiCredentials & credentials, runtime::CancelToken & token, ConnectionStatus & outcome);
    void SetState(State state);

    NetworkContext & mContext;
    WiFiInterface & mWiFi;
    atomic_t mState;
};

} // namespace provisioning
