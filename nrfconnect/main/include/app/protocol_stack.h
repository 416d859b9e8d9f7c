#pragma once

#include "provisioning/wifi_interface.h"
#include "runtime/cancel_token.h"

#include <lib/core/CHIPError.h>
#include <lib/core/Optional.h>
#include <system/SystemClock.h>

#include <cstdint>

namespace app
{

enum class TransportKind : uint8_t
{
    kBle,
    kNetwork,
};

struct CommissioningWindow
{
    chip::System::Clock::Seconds32 timeout;
};

/**
 * The parts of the Matter stack the orchestrator drives. Every Run*() call
 * blocks until the token is raised or the activity ends on its own.
 */
class ProtocolStack
{
public:
    virtual ~ProtocolStack() = default;

    // True once the device belongs to at least one fabric.
    virtual bool IsCommissioned() = 0;

    // Serves incoming sessions. Ends with CHIP_ERROR_TIMEOUT when an armed
    // fail-safe expires.
    virtual CHIP_ERROR RunResponder(runtime::CancelToken & token) = 0;

    // Keeps the given transport open. With a window, the device is discoverable
    // for commissioning and the call ends with CHIP_ERROR_TIMEOUT when the
    // window closes.
    virtual CHIP_ERROR RunTransport(TransportKind kind, const chip::Optional<CommissioningWindow> & window,
                                    runtime::CancelToken & token) = 0;

    // Advertises the operational service on the given addresses.
    virtual CHIP_ERROR RunDiscoveryBroadcast(const provisioning::InterfaceAddresses & addresses,
                                             runtime::CancelToken & token) = 0;
};

} // namespace app
