#pragma once

#include <lib/core/CHIPError.h>
#include <lib/support/CodeUtils.h>
#include <lib/support/Span.h>

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace provisioning
{

/**
 * Fixed-capacity opaque byte string. Always kept NUL terminated so it can be
 * handed to C APIs that take SSIDs and passphrases as strings.
 */
template <size_t kCapacity>
class BoundedBytes
{
public:
    static constexpr size_t Capacity() { return kCapacity; }

    // Leaves the current value untouched when the input does not fit.
    CHIP_ERROR Set(chip::ByteSpan value)
    {
        VerifyOrReturnError(value.size() <= kCapacity, CHIP_ERROR_BUFFER_TOO_SMALL);
        if (!value.empty())
        {
            memcpy(mData, value.data(), value.size());
        }
        mLength        = value.size();
        mData[mLength] = 0;
        return CHIP_NO_ERROR;
    }

    CHIP_ERROR Set(const char * value)
    {
        return Set(chip::ByteSpan(reinterpret_cast<const uint8_t *>(value), strlen(value)));
    }

    void Clear()
    {
        mLength  = 0;
        mData[0] = 0;
    }

    chip::ByteSpan Span() const { return chip::ByteSpan(mData, mLength); }
    const char * c_str() const { return reinterpret_cast<const char *>(mData); }
    size_t Length() const { return mLength; }
    bool Empty() const { return mLength == 0; }

    bool Equals(chip::ByteSpan other) const { return Span().data_equal(other); }
    bool operator==(const BoundedBytes & other) const { return Equals(other.Span()); }
    bool operator!=(const BoundedBytes & other) const { return !Equals(other.Span()); }

private:
    uint8_t mData[kCapacity + 1] = {};
    size_t mLength               = 0;
};

constexpr size_t kMaxSsidLength     = 32;
constexpr size_t kMaxPasswordLength = 64;

using Ssid     = BoundedBytes<kMaxSsidLength>;
using Password = BoundedBytes<kMaxPasswordLength>;

} // namespace provisioning
