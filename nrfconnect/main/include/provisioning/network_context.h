#pragma once

#include "provisioning/wifi_credentials.h"
#include "runtime/notification.h"

#include <lib/core/CHIPError.h>
#include <lib/core/Optional.h>
#include <lib/support/Span.h>
#include <zephyr/kernel.h>

#include <cstdint>

namespace provisioning
{

/**
 * Credentials and connection status shared by the commissioning cluster, the
 * network manager and the persistence loop.
 *
 * Every access goes through Lock(). The guard must not be held across any
 * blocking call; notifications caused by a mutation are raised after the
 * mutex is released.
 */
class NetworkContext
{
public:
    struct State
    {
        NetworkList networks;
        chip::Optional<ConnectionStatus> status;
        chip::Optional<Ssid> connectRequested;
        // Set on every change to `networks`, cleared once that generation is in storage.
        bool changed        = false;
        uint32_t generation = 0;

        void MarkChanged()
        {
            changed = true;
            generation++;
        }
    };

    class Observer
    {
    public:
        virtual ~Observer() = default;

        // Runs on the thread that reported the status, without the lock held.
        virtual void OnStatusChanged() = 0;
    };

    class LockedState
    {
    public:
        ~LockedState();

        LockedState(const LockedState &)             = delete;
        LockedState & operator=(const LockedState &) = delete;

        State * operator->() { return &mContext.mState; }
        State & operator*() { return mContext.mState; }

    private:
        friend class NetworkContext;

        explicit LockedState(NetworkContext & context);

        NetworkContext & mContext;
        uint32_t mGeneration;
    };

    NetworkContext();

    NetworkContext(const NetworkContext &)             = delete;
    NetworkContext & operator=(const NetworkContext &) = delete;

    LockedState Lock() { return LockedState(*this); }

    // Installs the list read from storage at boot. Does not mark it changed.
    void Seed(const NetworkList & networks);

    // Records the intent and then wakes whoever waits on ConnectRequested().
    CHIP_ERROR RequestConnect(chip::ByteSpan ssid);
    bool TakeConnectRequest(Ssid & ssid);
    bool HasConnectRequest();

    void SetStatus(const ConnectionStatus & status);
    void SetObserver(Observer * observer) { mObserver = observer; }

    runtime::Notification & ConnectRequested() { return mConnectRequested; }
    runtime::Notification & Changed() { return mChanged; }

private:
    struct k_mutex mMutex;
    State mState;
    runtime::Notification mConnectRequested;
    runtime::Notification mChanged;
    Observer * mObserver = nullptr;
};

} // namespace provisioning
