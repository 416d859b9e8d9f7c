#include "provisioning/network_context.h"

#include <lib/support/CodeUtils.h>

namespace provisioning
{

NetworkContext::LockedState::LockedState(NetworkContext & context) : mContext(context)
{
    k_mutex_lock(&mContext.mMutex, K_FOREVER);
    mGeneration = mContext.mState.generation;
}

NetworkContext::LockedState::~LockedState()
{
    const bool changed = mContext.mState.generation != mGeneration;
    k_mutex_unlock(&mContext.mMutex);

    if (changed)
    {
        mContext.mChanged.Notify();
    }
}

NetworkContext::NetworkContext()
{
    k_mutex_init(&mMutex);
}

void NetworkContext::Seed(const NetworkList & networks)
{
    auto state      = Lock();
    state->networks = networks;
    state->changed  = false;
}

CHIP_ERROR NetworkContext::RequestConnect(chip::ByteSpan ssid)
{
    Ssid requested;
    ReturnErrorOnFailure(requested.Set(ssid));

    {
        auto state = Lock();
        state->connectRequested.SetValue(requested);
    }

    mConnectRequested.Notify();
    return CHIP_NO_ERROR;
}

bool NetworkContext::TakeConnectRequest(Ssid & ssid)
{
    auto state = Lock();
    VerifyOrReturnValue(state->connectRequested.HasValue(), false);

    ssid = state->connectRequested.Value();
    state->connectRequested.ClearValue();
    return true;
}

bool NetworkContext::HasConnectRequest()
{
    return Lock()->connectRequested.HasValue();
}

void NetworkContext::SetStatus(const ConnectionStatus & status)
{
    {
        auto state = Lock();
        state->status.SetValue(status);
    }

    if (mObserver != nullptr)
    {
        mObserver->OnStatusChanged();
    }
}

} // namespace provisioning
