#pragma once

#include "runtime/cancel_token.h"
#include "runtime/task.h"
#include "runtime/task_pool.h"

#include <lib/core/CHIPError.h>
#include <zephyr/kernel.h>
#include <zephyr/sys/atomic.h>

#include <cstddef>

namespace runtime
{

/**
 * Runs its members concurrently on pool workers. The first member to return,
 * successfully or not, decides the result of Run(); every other member is then
 * cancelled and joined before Run() returns, so no worker outlives the group.
 *
 * A member that ignores its token for longer than
 * CONFIG_NETPROV_TASK_CANCEL_TIMEOUT_MS is aborted.
 */
class RaceGroup
{
public:
    static constexpr size_t kMaxMembers = 3;

    explicit RaceGroup(const char * name);

    RaceGroup(const RaceGroup &)             = delete;
    RaceGroup & operator=(const RaceGroup &) = delete;

    CHIP_ERROR Add(Task & task);

    // Returns the winner's result, CHIP_ERROR_CANCELLED when the parent token
    // was raised first, or CHIP_ERROR_NO_MEMORY when no worker was available.
    CHIP_ERROR Run(CancelToken & parent);

private:
    static constexpr atomic_val_t kNoWinner = -1;

    struct Member
    {
        RaceGroup * group        = nullptr;
        Task * task              = nullptr;
        TaskPool::Worker * worker = nullptr;
        CancelToken token;
        CHIP_ERROR result = CHIP_NO_ERROR;
        size_t index      = 0;
    };

    static void MemberEntry(void * memberArg, void *, void *);

    void Settle(Member & member);
    void CancelAndJoin(size_t started);

    const char * mName;
    Member mMembers[kMaxMembers];
    size_t mCount = 0;
    atomic_t mWinner;
    struct k_sem mDone;
};

} // namespace runtime
