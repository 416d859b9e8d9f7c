#include "runtime/notification.h"

#include <lib/support/CodeUtils.h>
#include <system/SystemError.h>

namespace runtime
{

CHIP_ERROR WaitAny(Notification * const * notifications, size_t count, CancelToken & token, k_timeout_t timeout)
{
    VerifyOrReturnError(count <= kMaxWaitNotifications, CHIP_ERROR_INVALID_ARGUMENT);
    VerifyOrReturnError(!token.IsCancelled(), CHIP_ERROR_CANCELLED);

    struct k_poll_event events[kMaxWaitNotifications + 1];
    k_poll_event_init(&events[0], K_POLL_TYPE_SIGNAL, K_POLL_MODE_NOTIFY_ONLY, token.Signal());
    for (size_t i = 0; i < count; i++)
    {
        k_poll_event_init(&events[i + 1], K_POLL_TYPE_SIGNAL, K_POLL_MODE_NOTIFY_ONLY, notifications[i]->Signal());
    }

    int rc = k_poll(events, static_cast<int>(count + 1), timeout);

    if (token.IsCancelled())
    {
        return CHIP_ERROR_CANCELLED;
    }
    if (rc == -EAGAIN)
    {
        return CHIP_ERROR_TIMEOUT;
    }
    VerifyOrReturnError(rc == 0, chip::System::MapErrorZephyr(rc));

    for (size_t i = 0; i < count; i++)
    {
        if (events[i + 1].state == K_POLL_STATE_SIGNALED)
        {
            notifications[i]->Reset();
        }
    }

    return CHIP_NO_ERROR;
}

CHIP_ERROR Wait(Notification & notification, CancelToken & token, k_timeout_t timeout)
{
    Notification * notifications[] = { &notification };
    return WaitAny(notifications, 1, token, timeout);
}

CHIP_ERROR Sleep(k_timeout_t duration, CancelToken & token)
{
    CHIP_ERROR err = WaitAny(nullptr, 0, token, duration);
    return (err == CHIP_ERROR_TIMEOUT) ? CHIP_NO_ERROR : err;
}

CHIP_ERROR WaitCancelled(CancelToken & token)
{
    CHIP_ERROR err;
    do
    {
        err = WaitAny(nullptr, 0, token, K_FOREVER);
    } while (err == CHIP_NO_ERROR || err == CHIP_ERROR_TIMEOUT);
    return err;
}

} // namespace runtime
