#include "app/orchestrator.h"

#include "runtime/notification.h"
#include "runtime/race_group.h"
#include "runtime/task.h"

#include <lib/support/CodeUtils.h>
#include <zephyr/logging/log.h>

LOG_MODULE_DECLARE(netprov_app, LOG_LEVEL_INF);

using chip::MakeOptional;
using chip::NullOptional;
using runtime::CancelToken;
using runtime::MakeTask;
using runtime::RaceGroup;

namespace app
{

namespace
{

const char * PhaseName(Orchestrator::Phase phase)
{
    switch (phase)
    {
    case Orchestrator::Phase::kStarting:
        return "starting";
    case Orchestrator::Phase::kCommissioning:
        return "commissioning";
    case Orchestrator::Phase::kOperating:
        return "operating";
    }
    return "?";
}

} // namespace

Orchestrator::Orchestrator(chip::PersistentStorageDelegate & storage, provisioning::WiFiInterface & wifi,
                           CommissioningChannel & channel, ProtocolStack & stack, const Config & config) :
    mStore(storage),
    mPersistence(mContext, mStore, mBuffers), mNetworkManager(mContext, wifi), mWiFi(wifi), mChannel(channel), mStack(stack),
    mConfig(config)
{
    atomic_set(&mPhase, static_cast<atomic_val_t>(Phase::kStarting));
}

CHIP_ERROR Orchestrator::Init()
{
    provisioning::PersistenceManager::BufferPool::Handle buffer;
    ReturnErrorOnFailure(mBuffers.Acquire(buffer));

    provisioning::NetworkList networks;
    CHIP_ERROR err = mStore.Load(networks, buffer.Span());
    if (err != CHIP_NO_ERROR)
    {
        LOG_ERR("Stored networks unreadable, starting empty: %" CHIP_ERROR_FORMAT, err.Format());
        networks.Clear();
    }

    mContext.Seed(networks);
    LOG_INF("%u stored network(s)", static_cast<unsigned>(networks.Size()));
    return CHIP_NO_ERROR;
}

void Orchestrator::SetPhase(Phase phase)
{
    atomic_set(&mPhase, static_cast<atomic_val_t>(phase));
    LOG_INF("Phase: %s", PhaseName(phase));
}

bool Orchestrator::IsCommissioned()
{
    bool hasNetworks;
    {
        auto state  = mContext.Lock();
        hasNetworks = !state->networks.Empty();
    }
    return hasNetworks && mStack.IsCommissioned();
}

CHIP_ERROR Orchestrator::Run(CancelToken & token)
{
    while (true)
    {
        CHIP_ERROR err = RunOnce(token);
        VerifyOrReturnError(!token.IsCancelled(), CHIP_ERROR_CANCELLED);

        LOG_ERR("Phase %s ended: %" CHIP_ERROR_FORMAT, PhaseName(GetPhase()), err.Format());
        ReturnErrorOnFailure(runtime::Sleep(K_MSEC(CONFIG_NETPROV_PHASE_RESTART_DELAY_MS), token));
    }
}

CHIP_ERROR Orchestrator::RunOnce(CancelToken & token)
{
    if (!IsCommissioned())
    {
        ReturnErrorOnFailure(Commission(token));
        VerifyOrReturnError(IsCommissioned() || mContext.HasConnectRequest(), CHIP_ERROR_INCORRECT_STATE);
    }

    return Operate(token);
}

CHIP_ERROR Orchestrator::Commission(CancelToken & token)
{
    SetPhase(Phase::kCommissioning);
    VerifyOrReturnError(!mContext.HasConnectRequest(), CHIP_NO_ERROR);

    auto session = MakeTask("commission", [this](CancelToken & t) { return RunCommissioningSession(t); });
    auto connect = MakeTask("await-connect", [this](CancelToken & t) { return WaitNetworkConnect(t); });

    RaceGroup race("commissioning");
    ReturnErrorOnFailure(race.Add(session));
    ReturnErrorOnFailure(race.Add(connect));
    return race.Run(token);
}

CHIP_ERROR Orchestrator::RunCommissioningSession(CancelToken & token)
{
    const CommissioningWindow window = { mConfig.commissioningWindowTimeout };

    auto channel = MakeTask("ble", [this](CancelToken & t) { return mChannel.Run(mConfig.deviceName, t); });
    auto session = MakeTask("ble-session", [this, &window](CancelToken & t) {
        return RunSession(TransportKind::kBle, MakeOptional(window), t);
    });

    RaceGroup race("ble");
    ReturnErrorOnFailure(race.Add(channel));
    ReturnErrorOnFailure(race.Add(session));
    return race.Run(token);
}

CHIP_ERROR Orchestrator::WaitNetworkConnect(CancelToken & token)
{
    while (!mContext.HasConnectRequest())
    {
        ReturnErrorOnFailure(runtime::Wait(mContext.ConnectRequested(), token));
    }

    LOG_INF("Network connect requested, leaving commissioning");
    return CHIP_NO_ERROR;
}

CHIP_ERROR Orchestrator::Operate(CancelToken & token)
{
    SetPhase(Phase::kOperating);

    CHIP_ERROR err = mWiFi.Enable();
    VerifyOrReturnError(err == CHIP_NO_ERROR, err, LOG_ERR("Wi-Fi enable failed: %" CHIP_ERROR_FORMAT, err.Format()));

    auto interface = MakeTask("interface", [this](CancelToken & t) { return RunWithInterface(t); });

    RaceGroup race("operating");
    ReturnErrorOnFailure(race.Add(mNetworkManager));
    ReturnErrorOnFailure(race.Add(interface));
    return race.Run(token);
}

CHIP_ERROR Orchestrator::RunWithInterface(CancelToken & token)
{
    while (true)
    {
        provisioning::InterfaceAddresses addresses;
        ReturnErrorOnFailure(mWiFi.WaitInterfaceReady(token, addresses));
        LOG_INF("Wi-Fi interface ready");

        auto session   = MakeTask("net-session", [this](CancelToken & t) {
            return RunSession(TransportKind::kNetwork, NullOptional, t);
        });
        auto discovery = MakeTask("dnssd", [this, &addresses](CancelToken & t) {
            return mStack.RunDiscoveryBroadcast(addresses, t);
        });
        auto watch     = MakeTask("addr-watch", [this, &addresses](CancelToken & t) {
            return mWiFi.WaitAddressChange(addresses, t);
        });

        RaceGroup race("interface");
        ReturnErrorOnFailure(race.Add(session));
        ReturnErrorOnFailure(race.Add(discovery));
        ReturnErrorOnFailure(race.Add(watch));

        // Only the address watch finishes cleanly.
        ReturnErrorOnFailure(race.Run(token));
        LOG_INF("Interface addresses changed, restarting session");
    }
}

CHIP_ERROR Orchestrator::RunSession(TransportKind kind, const chip::Optional<CommissioningWindow> & window,
                                    CancelToken & token)
{
    auto responder = MakeTask("responder", [this](CancelToken & t) { return mStack.RunResponder(t); });
    auto transport = MakeTask("transport", [this, kind, &window](CancelToken & t) {
        return mStack.RunTransport(kind, window, t);
    });

    RaceGroup race("session");
    ReturnErrorOnFailure(race.Add(mPersistence));
    ReturnErrorOnFailure(race.Add(responder));
    ReturnErrorOnFailure(race.Add(transport));
    return race.Run(token);
}

} // namespace app
