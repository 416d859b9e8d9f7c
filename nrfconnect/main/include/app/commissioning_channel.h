#pragma once

#include "runtime/cancel_token.h"

#include <lib/core/CHIPError.h>

namespace app
{

/**
 * Out-of-band link used to reach an uncommissioned device.
 */
class CommissioningChannel
{
public:
    virtual ~CommissioningChannel() = default;

    // Advertises under `deviceName`, accepts a peer and carries the connection.
    // Returns when the connection closes or the token is raised.
    virtual CHIP_ERROR Run(const char * deviceName, runtime::CancelToken & token) = 0;
};

} // namespace app
