#pragma once

#include "runtime/cancel_token.h"

#include <lib/core/CHIPError.h>
#include <zephyr/kernel.h>

#include <cstddef>

namespace runtime
{

/**
 * Single-slot wake-up hint. Repeated Notify() calls before a waiter runs
 * collapse into one; waiters must re-read the state they care about after
 * waking instead of counting notifications.
 */
class Notification
{
public:
    Notification() { k_poll_signal_init(&mSignal); }

    Notification(const Notification &)             = delete;
    Notification & operator=(const Notification &) = delete;

    void Notify() { k_poll_signal_raise(&mSignal, 0); }
    void Reset() { k_poll_signal_reset(&mSignal); }

    bool IsPending()
    {
        unsigned int signaled = 0;
        int result            = 0;
        k_poll_signal_check(&mSignal, &signaled, &result);
        return signaled != 0;
    }

    struct k_poll_signal * Signal() { return &mSignal; }

private:
    struct k_poll_signal mSignal;
};

constexpr size_t kMaxWaitNotifications = 4;

// The helpers below return CHIP_ERROR_CANCELLED as soon as the token is
// raised, CHIP_ERROR_TIMEOUT when the timeout elapses first and CHIP_NO_ERROR
// when a notification fired. Fired notifications are consumed.
CHIP_ERROR Wait(Notification & notification, CancelToken & token, k_timeout_t timeout = K_FOREVER);
CHIP_ERROR WaitAny(Notification * const * notifications, size_t count, CancelToken & token,
                   k_timeout_t timeout = K_FOREVER);

// Returns CHIP_NO_ERROR once the full duration elapsed.
CHIP_ERROR Sleep(k_timeout_t duration, CancelToken & token);

// Parks the caller until the token is raised.
CHIP_ERROR WaitCancelled(CancelToken & token);

} // namespace runtime
