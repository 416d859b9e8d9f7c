#pragma once

#include <lib/core/CHIPError.h>
#include <zephyr/kernel.h>

#include <cstddef>

namespace runtime
{

/**
 * Fixed set of worker threads with statically allocated stacks
 * (CONFIG_NETPROV_TASK_POOL_SIZE x CONFIG_NETPROV_TASK_STACK_SIZE).
 */
class TaskPool
{
public:
    static constexpr size_t kWorkerCount = CONFIG_NETPROV_TASK_POOL_SIZE;

    class Worker
    {
    public:
        void Start(k_thread_entry_t entry, void * arg, const char * name);
        int Join(k_timeout_t timeout) { return k_thread_join(&mThread, timeout); }
        void Abort() { k_thread_abort(&mThread); }

    private:
        friend class TaskPool;

        struct k_thread mThread;
        size_t mIndex = 0;
        bool mInUse   = false;
    };

    static TaskPool & Instance();

    // Fails with CHIP_ERROR_NO_MEMORY when every worker is taken.
    CHIP_ERROR Acquire(Worker *& worker);
    void Release(Worker & worker);
    size_t Available();

private:
    TaskPool();

    Worker mWorkers[kWorkerCount];
    struct k_spinlock mLock = {};
};

} // namespace runtime
