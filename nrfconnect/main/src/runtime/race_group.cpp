#include "runtime/race_group.h"

#include <lib/support/CodeUtils.h>
#include <system/SystemError.h>
#include <zephyr/logging/log.h>

LOG_MODULE_DECLARE(netprov_app, LOG_LEVEL_INF);

namespace runtime
{

RaceGroup::RaceGroup(const char * name) : mName(name)
{
    atomic_set(&mWinner, kNoWinner);
    k_sem_init(&mDone, 0, 1);
}

CHIP_ERROR RaceGroup::Add(Task & task)
{
    VerifyOrReturnError(mCount < kMaxMembers, CHIP_ERROR_NO_MEMORY);

    Member & member = mMembers[mCount];
    member.group    = this;
    member.task     = &task;
    member.index    = mCount;
    mCount++;
    return CHIP_NO_ERROR;
}

void RaceGroup::MemberEntry(void * memberArg, void *, void *)
{
    Member & member = *static_cast<Member *>(memberArg);
    member.result   = member.task->Run(member.token);
    member.group->Settle(member);
}

void RaceGroup::Settle(Member & member)
{
    if (atomic_cas(&mWinner, kNoWinner, static_cast<atomic_val_t>(member.index)))
    {
        k_sem_give(&mDone);
    }
}

CHIP_ERROR RaceGroup::Run(CancelToken & parent)
{
    VerifyOrReturnError(mCount > 0, CHIP_ERROR_INVALID_ARGUMENT);

    atomic_set(&mWinner, kNoWinner);
    k_sem_reset(&mDone);

    CHIP_ERROR err = CHIP_NO_ERROR;
    size_t started = 0;
    for (; started < mCount; started++)
    {
        Member & member = mMembers[started];
        err             = TaskPool::Instance().Acquire(member.worker);
        if (err != CHIP_NO_ERROR)
        {
            break;
        }
        member.token.Reset();
        member.result = CHIP_NO_ERROR;
        member.worker->Start(MemberEntry, &member, member.task->Name());
    }

    if (err == CHIP_NO_ERROR)
    {
        struct k_poll_event events[2];
        k_poll_event_init(&events[0], K_POLL_TYPE_SEM_AVAILABLE, K_POLL_MODE_NOTIFY_ONLY, &mDone);
        k_poll_event_init(&events[1], K_POLL_TYPE_SIGNAL, K_POLL_MODE_NOTIFY_ONLY, parent.Signal());

        int rc = k_poll(events, ARRAY_SIZE(events), K_FOREVER);

        atomic_val_t winner = atomic_get(&mWinner);
        if (winner != kNoWinner)
        {
            err = mMembers[winner].result;
            LOG_DBG("%s: %s finished first (%" CHIP_ERROR_FORMAT ")", mName, mMembers[winner].task->Name(), err.Format());
        }
        else if (rc != 0)
        {
            err = chip::System::MapErrorZephyr(rc);
        }
        else
        {
            err = CHIP_ERROR_CANCELLED;
        }
    }

    CancelAndJoin(started);
    return err;
}

void RaceGroup::CancelAndJoin(size_t started)
{
    for (size_t i = 0; i < started; i++)
    {
        mMembers[i].token.Cancel();
    }

    for (size_t i = 0; i < started; i++)
    {
        Member & member = mMembers[i];
        if (member.worker->Join(K_MSEC(CONFIG_NETPROV_TASK_CANCEL_TIMEOUT_MS)) != 0)
        {
            LOG_WRN("%s: %s ignored cancellation, aborting", mName, member.task->Name());
            member.worker->Abort();
        }
        TaskPool::Instance().Release(*member.worker);
        member.worker = nullptr;
    }
}

} // namespace runtime
