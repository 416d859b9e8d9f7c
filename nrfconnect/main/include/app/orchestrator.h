#pragma once

#include "app/commissioning_channel.h"
#include "app/protocol_stack.h"
#include "provisioning/network_context.h"
#include "provisioning/network_manager.h"
#include "provisioning/network_store.h"
#include "provisioning/persistence_manager.h"
#include "provisioning/wifi_interface.h"
#include "runtime/cancel_token.h"

#include <lib/core/CHIPError.h>
#include <lib/core/CHIPPersistentStorageDelegate.h>
#include <lib/core/Optional.h>
#include <system/SystemClock.h>
#include <zephyr/sys/atomic.h>

#include <cstdint>

namespace app
{

/**
 * Top-level supervisor. Owns the network state and alternates between the
 * commissioning phase (BLE session until a network connect is requested) and
 * the operating phase (network manager plus a session over the Wi-Fi
 * interface). A failed phase is logged and restarted after
 * CONFIG_NETPROV_PHASE_RESTART_DELAY_MS.
 */
class Orchestrator
{
public:
    enum class Phase : uint8_t
    {
        kStarting,
        kCommissioning,
        kOperating,
    };

    struct Config
    {
        const char * deviceName;
        chip::System::Clock::Seconds32 commissioningWindowTimeout;
    };

    Orchestrator(chip::PersistentStorageDelegate & storage, provisioning::WiFiInterface & wifi, CommissioningChannel & channel,
                 ProtocolStack & stack, const Config & config);

    Orchestrator(const Orchestrator &)             = delete;
    Orchestrator & operator=(const Orchestrator &) = delete;

    // Seeds the context from storage. Unreadable data is dropped.
    CHIP_ERROR Init();

    // Runs phases until the token is raised, then returns CHIP_ERROR_CANCELLED.
    CHIP_ERROR Run(runtime::CancelToken & token);

    // One pass: commissioning if needed, then operating until it fails.
    CHIP_ERROR RunOnce(runtime::CancelToken & token);

    provisioning::NetworkContext & Context() { return mContext; }
    Phase GetPhase() { return static_cast<Phase>(atomic_get(&mPhase)); }

private:
    bool IsCommissioned();
    void SetPhase(Phase phase);

    CHIP_ERROR Commission(runtime::CancelToken & token);
    CHIP_ERROR RunCommissioningSession(runtime::CancelToken & token);
    CHIP_ERROR WaitNetworkConnect(runtime::CancelToken & token);

    CHIP_ERROR Operate(runtime::CancelToken & token);
    CHIP_ERROR RunWithInterface(runtime::CancelToken & token);

    CHIP_ERROR RunSession(TransportKind kind, const chip::Optional<CommissioningWindow> & window,
                          runtime::CancelToken & token);

    provisioning::NetworkContext mContext;
    provisioning::NetworkStore mStore;
    provisioning::PersistenceManager::BufferPool mBuffers;
    provisioning::PersistenceManager mPersistence;
    provisioning::NetworkManager mNetworkManager;

    provisioning::WiFiInterface & mWiFi;
    CommissioningChannel & mChannel;
    ProtocolStack & mStack;
    Config mConfig;
    atomic_t mPhase;
};

} // namespace app
