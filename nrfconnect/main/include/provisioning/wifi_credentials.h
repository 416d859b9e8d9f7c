#pragma once

#include "provisioning/bounded_bytes.h"

#include <app-common/zap-generated/cluster-enums.h>
#include <lib/core/CHIPError.h>
#include <lib/support/Span.h>

#include <cstddef>
#include <cstdint>

namespace provisioning
{

using NetworkStatus = chip::app::Clusters::NetworkCommissioning::NetworkCommissioningStatusEnum;

struct WiFiCredentials
{
    Ssid ssid;
    Password password;
};

// Outcome of the last association attempt.
struct ConnectionStatus
{
    Ssid ssid;
    NetworkStatus status = NetworkStatus::kSuccess;
    int32_t value        = 0;
};

/**
 * Known networks in priority order. The position of an entry is the
 * NetworkIndex reported to commissioners.
 */
class NetworkList
{
public:
    static constexpr size_t kCapacity = CONFIG_NETPROV_MAX_NETWORKS;

    size_t Size() const { return mSize; }
    bool Empty() const { return mSize == 0; }
    bool Full() const { return mSize == kCapacity; }

    bool Find(chip::ByteSpan ssid, size_t & index) const;

    WiFiCredentials & operator[](size_t index) { return mEntries[index]; }
    const WiFiCredentials & operator[](size_t index) const { return mEntries[index]; }

    // CHIP_ERROR_NO_MEMORY when the list is full.
    CHIP_ERROR Append(const WiFiCredentials & entry);
    CHIP_ERROR RemoveAt(size_t index);
    // Moves the entry at `from` so it ends up at position `to`.
    CHIP_ERROR Move(size_t from, size_t to);
    void Clear() { mSize = 0; }

    const WiFiCredentials * begin() const { return mEntries; }
    const WiFiCredentials * end() const { return mEntries + mSize; }

private:
    WiFiCredentials mEntries[kCapacity];
    size_t mSize = 0;
};

} // namespace provisioning
