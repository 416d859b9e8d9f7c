#include "runtime/task_pool.h"

#include <zephyr/logging/log.h>

LOG_MODULE_DECLARE(netprov_app, LOG_LEVEL_INF);

K_THREAD_STACK_ARRAY_DEFINE(sWorkerStacks, CONFIG_NETPROV_TASK_POOL_SIZE, CONFIG_NETPROV_TASK_STACK_SIZE);

namespace runtime
{

TaskPool & TaskPool::Instance()
{
    static TaskPool sInstance;
    return sInstance;
}

TaskPool::TaskPool()
{
    for (size_t i = 0; i < kWorkerCount; i++)
    {
        mWorkers[i].mIndex = i;
    }
}

void TaskPool::Worker::Start(k_thread_entry_t entry, void * arg, const char * name)
{
    k_tid_t tid = k_thread_create(&mThread, sWorkerStacks[mIndex], K_THREAD_STACK_SIZEOF(sWorkerStacks[mIndex]), entry,
                                  arg, nullptr, nullptr, CONFIG_NETPROV_TASK_PRIORITY, 0, K_NO_WAIT);
    k_thread_name_set(tid, name);
}

CHIP_ERROR TaskPool::Acquire(Worker *& worker)
{
    k_spinlock_key_t key = k_spin_lock(&mLock);
    for (auto & candidate : mWorkers)
    {
        if (!candidate.mInUse)
        {
            candidate.mInUse = true;
            worker           = &candidate;
            k_spin_unlock(&mLock, key);
            return CHIP_NO_ERROR;
        }
    }
    k_spin_unlock(&mLock, key);

    LOG_ERR("Task pool exhausted (%u workers)", static_cast<unsigned>(kWorkerCount));
    return CHIP_ERROR_NO_MEMORY;
}

void TaskPool::Release(Worker & worker)
{
    k_spinlock_key_t key = k_spin_lock(&mLock);
    worker.mInUse        = false;
    k_spin_unlock(&mLock, key);
}

size_t TaskPool::Available()
{
    size_t available     = 0;
    k_spinlock_key_t key = k_spin_lock(&mLock);
    for (const auto & worker : mWorkers)
    {
        available += worker.mInUse ? 0 : 1;
    }
    k_spin_unlock(&mLock, key);
    return available;
}

} // namespace runtime
