#pragma once

#include <zephyr/kernel.h>

namespace runtime
{

/**
 * Cancellation flag handed to every long-running task.
 *
 * Once cancelled the token stays raised until Reset(), so any later k_poll()
 * on it returns immediately. Zephyr only wakes one poller per signal: a token
 * must have at most one thread blocked on it at a time.
 */
class CancelToken
{
public:
    CancelToken() { k_poll_signal_init(&mSignal); }

    CancelToken(const CancelToken &)             = delete;
    CancelToken & operator=(const CancelToken &) = delete;

    void Cancel() { k_poll_signal_raise(&mSignal, 0); }
    void Reset() { k_poll_signal_reset(&mSignal); }

    bool IsCancelled()
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

} // namespace runtime
