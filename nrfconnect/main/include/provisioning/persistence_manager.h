#pragma once

#include "provisioning/network_context.h"
#include "provisioning/network_store.h"
#include "runtime/buffer_pool.h"
#include "runtime/task.h"

#include <lib/core/CHIPError.h>
#include <lib/support/Span.h>

namespace provisioning
{

/**
 * Sole writer of the stored network list. Writes whenever the context is
 * marked changed; a failed write ends Run() with the storage error and leaves
 * the in-memory state (including the dirty flag) as it was.
 */
class PersistenceManager : public runtime::Task
{
public:
    using BufferPool = runtime::BufferPool<1, CONFIG_NETPROV_PERSIST_BUFFER_SIZE>;

    static_assert(CONFIG_NETPROV_PERSIST_BUFFER_SIZE >= NetworkStore::kMaxEncodedSize,
                  "CONFIG_NETPROV_PERSIST_BUFFER_SIZE cannot hold CONFIG_NETPROV_MAX_NETWORKS full entries");

    PersistenceManager(NetworkContext & context, NetworkStore & store, BufferPool & buffers) :
        mContext(context), mStore(store), mBuffers(buffers)
    {}

    const char * Name() const override { return "persistence"; }
    CHIP_ERROR Run(runtime::CancelToken & token) override;

    CHIP_ERROR PersistIfChanged(chip::MutableByteSpan buffer);

private:
    NetworkContext & mContext;
    NetworkStore & mStore;
    BufferPool & mBuffers;
};

} // namespace provisioning
