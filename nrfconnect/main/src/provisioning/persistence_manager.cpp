#include "provisioning/persistence_manager.h"

#include <lib/support/CodeUtils.h>
#include <zephyr/logging/log.h>

LOG_MODULE_DECLARE(netprov_app, LOG_LEVEL_INF);

namespace provisioning
{

CHIP_ERROR PersistenceManager::Run(runtime::CancelToken & token)
{
    BufferPool::Handle buffer;
    CHIP_ERROR err = mBuffers.Acquire(buffer);
    if (err != CHIP_NO_ERROR)
    {
        LOG_ERR("No persistence buffer available");
        return err;
    }

    while (true)
    {
        ReturnErrorOnFailure(PersistIfChanged(buffer.Span()));
        ReturnErrorOnFailure(runtime::Wait(mContext.Changed(), token));
    }
}

CHIP_ERROR PersistenceManager::PersistIfChanged(chip::MutableByteSpan buffer)
{
    NetworkList snapshot;
    uint32_t generation;

    {
        auto state = mContext.Lock();
        VerifyOrReturnValue(state->changed, CHIP_NO_ERROR);
        snapshot   = state->networks;
        generation = state->generation;
    }

    CHIP_ERROR err = mStore.Save(snapshot, buffer);
    if (err != CHIP_NO_ERROR)
    {
        LOG_ERR("Storing networks failed: %" CHIP_ERROR_FORMAT, err.Format());
        return err;
    }

    {
        auto state = mContext.Lock();
        // A command may have changed the list while it was being written.
        if (state->generation == generation)
        {
            state->changed = false;
        }
    }

    LOG_INF("Stored %u network(s)", static_cast<unsigned>(snapshot.Size()));
    return CHIP_NO_ERROR;
}

} // namespace provisioning
