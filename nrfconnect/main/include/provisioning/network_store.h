#pragma once

#include "provisioning/wifi_credentials.h"

#include <lib/core/CHIPError.h>
#include <lib/core/CHIPPersistentStorageDelegate.h>
#include <lib/support/Span.h>

#include <cstddef>
#include <cstdint>

namespace provisioning
{

/**
 * TLV encoding of the network list in the CHIP key-value store:
 *
 *   anonymous structure {
 *     0: version (uint8)
 *     1: array of structure { 0: ssid (octet string), 1: password (octet string) }
 *   }
 */
class NetworkStore
{
public:
    static constexpr char kStorageKey[]     = "g/netprov/wifi";
    static constexpr uint8_t kFormatVersion = 1;

    // Worst case: control byte, tag and 1-byte length per element, plus one
    // end-of-container byte per structure and array.
    static constexpr size_t kMaxEntrySize   = 1 + (3 + kMaxSsidLength) + (3 + kMaxPasswordLength) + 1;
    static constexpr size_t kMaxEncodedSize = 1 + 3 + 2 + NetworkList::kCapacity * kMaxEntrySize + 1 + 1;

    explicit NetworkStore(chip::PersistentStorageDelegate & storage) : mStorage(storage) {}

    // `buffer` is scratch space for the encoded blob.
    CHIP_ERROR Save(const NetworkList & networks, chip::MutableByteSpan buffer);
    // A missing key yields an empty list.
    CHIP_ERROR Load(NetworkList & networks, chip::MutableByteSpan buffer);

private:
    chip::PersistentStorageDelegate & mStorage;
};

} // namespace provisioning
