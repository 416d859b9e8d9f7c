#include "runtime/notification.h"
#include "runtime/race_group.h"
#include "runtime/task.h"
#include "runtime/task_pool.h"

#include <zephyr/kernel.h>
#include <zephyr/sys/atomic.h>
#include <zephyr/ztest.h>

using runtime::CancelToken;
using runtime::MakeTask;
using runtime::RaceGroup;
using runtime::TaskPool;

namespace
{

atomic_t sCancelledMembers;

CHIP_ERROR WaitAndCount(CancelToken & token)
{
    CHIP_ERROR err = runtime::WaitCancelled(token);
    if (err == CHIP_ERROR_CANCELLED)
    {
        atomic_inc(&sCancelledMembers);
    }
    return err;
}

void ResetCounters(void *)
{
    atomic_set(&sCancelledMembers, 0);
}

void CheckPoolIsFull(void *)
{
    zassert_equal(TaskPool::Instance().Available(), TaskPool::kWorkerCount, "worker leaked");
}

} // namespace

ZTEST_SUITE(race_group, nullptr, nullptr, ResetCounters, CheckPoolIsFull, nullptr);

ZTEST(race_group, test_first_error_wins_and_siblings_are_cancelled)
{
    CancelToken parent;
    auto failing = MakeTask("failing", [](CancelToken & token) -> CHIP_ERROR {
        ReturnErrorOnFailure(runtime::Sleep(K_MSEC(20), token));
        return CHIP_ERROR_INTERNAL;
    });
    auto waiterA = MakeTask("waiter-a", WaitAndCount);
    auto waiterB = MakeTask("waiter-b", WaitAndCount);

    RaceGroup race("error");
    zassert_equal(race.Add(failing), CHIP_NO_ERROR);
    zassert_equal(race.Add(waiterA), CHIP_NO_ERROR);
    zassert_equal(race.Add(waiterB), CHIP_NO_ERROR);

    zassert_equal(race.Run(parent), CHIP_ERROR_INTERNAL);
    zassert_equal(atomic_get(&sCancelledMembers), 2);
}

ZTEST(race_group, test_first_success_wins)
{
    CancelToken parent;
    auto done   = MakeTask("done", [](CancelToken &) { return CHIP_NO_ERROR; });
    auto waiter = MakeTask("waiter", WaitAndCount);

    RaceGroup race("success");
    zassert_equal(race.Add(done), CHIP_NO_ERROR);
    zassert_equal(race.Add(waiter), CHIP_NO_ERROR);

    zassert_equal(race.Run(parent), CHIP_NO_ERROR);
    zassert_equal(atomic_get(&sCancelledMembers), 1);
}

ZTEST(race_group, test_cancelled_parent_cancels_every_member)
{
    CancelToken parent;
    parent.Cancel();

    auto waiterA = MakeTask("waiter-a", WaitAndCount);
    auto waiterB = MakeTask("waiter-b", WaitAndCount);

    RaceGroup race("parent");
    zassert_equal(race.Add(waiterA), CHIP_NO_ERROR);
    zassert_equal(race.Add(waiterB), CHIP_NO_ERROR);

    zassert_equal(race.Run(parent), CHIP_ERROR_CANCELLED);
    zassert_equal(atomic_get(&sCancelledMembers), 2);
}

ZTEST(race_group, test_member_ignoring_cancellation_is_aborted)
{
    CancelToken parent;
    auto stubborn = MakeTask("stubborn", [](CancelToken &) {
        k_sleep(K_SECONDS(30));
        return CHIP_NO_ERROR;
    });
    auto done     = MakeTask("done", [](CancelToken & token) { return runtime::Sleep(K_MSEC(10), token); });

    RaceGroup race("abort");
    zassert_equal(race.Add(stubborn), CHIP_NO_ERROR);
    zassert_equal(race.Add(done), CHIP_NO_ERROR);

    int64_t start = k_uptime_get();
    zassert_equal(race.Run(parent), CHIP_NO_ERROR);
    zassert_true(k_uptime_get() - start < 5000, "stubborn member was not aborted");
}

ZTEST(race_group, test_nested_groups_release_their_workers)
{
    CancelToken parent;
    auto inner = MakeTask("inner", [](CancelToken & token) {
        auto waiter = MakeTask("inner-waiter", WaitAndCount);
        auto done   = MakeTask("inner-done", [](CancelToken & t) -> CHIP_ERROR {
            ReturnErrorOnFailure(runtime::Sleep(K_MSEC(20), t));
            return CHIP_ERROR_TIMEOUT;
        });

        RaceGroup group("inner");
        ReturnErrorOnFailure(group.Add(waiter));
        ReturnErrorOnFailure(group.Add(done));
        return group.Run(token);
    });
    auto outerWaiter = MakeTask("outer-waiter", WaitAndCount);

    RaceGroup race("outer");
    zassert_equal(race.Add(inner), CHIP_NO_ERROR);
    zassert_equal(race.Add(outerWaiter), CHIP_NO_ERROR);

    zassert_equal(race.Run(parent), CHIP_ERROR_TIMEOUT);
    zassert_equal(atomic_get(&sCancelledMembers), 2);
}

ZTEST(race_group, test_group_capacity_is_bounded)
{
    auto waiter = MakeTask("waiter", WaitAndCount);

    RaceGroup race("full");
    for (size_t i = 0; i < RaceGroup::kMaxMembers; i++)
    {
        zassert_equal(race.Add(waiter), CHIP_NO_ERROR);
    }
    zassert_equal(race.Add(waiter), CHIP_ERROR_NO_MEMORY);
}

ZTEST(race_group, test_exhausted_pool_fails_the_group)
{
    CancelToken parent;
    TaskPool::Worker * held[TaskPool::kWorkerCount];
    size_t heldCount = 0;

    while (TaskPool::Instance().Available() > 1)
    {
        zassert_equal(TaskPool::Instance().Acquire(held[heldCount]), CHIP_NO_ERROR);
        heldCount++;
    }

    auto waiterA = MakeTask("waiter-a", WaitAndCount);
    auto waiterB = MakeTask("waiter-b", WaitAndCount);

    RaceGroup race("exhausted");
    zassert_equal(race.Add(waiterA), CHIP_NO_ERROR);
    zassert_equal(race.Add(waiterB), CHIP_NO_ERROR);

    zassert_equal(race.Run(parent), CHIP_ERROR_NO_MEMORY);
    zassert_equal(atomic_get(&sCancelledMembers), 1);

    for (size_t i = 0; i < heldCount; i++)
    {
        TaskPool::Instance().Release(*held[i]);
    }
}

ZTEST(race_group, test_notification_fired_before_wait_is_seen)
{
    CancelToken token;
    runtime::Notification notification;

    notification.Notify();
    zassert_equal(runtime::Wait(notification, token, K_NO_WAIT), CHIP_NO_ERROR);
    zassert_false(notification.IsPending());
    zassert_equal(runtime::Wait(notification, token, K_MSEC(10)), CHIP_ERROR_TIMEOUT);

    token.Cancel();
    notification.Notify();
    zassert_equal(runtime::Wait(notification, token), CHIP_ERROR_CANCELLED);
}
