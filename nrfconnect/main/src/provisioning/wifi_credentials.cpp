#include "provisioning/wifi_credentials.h"

#include <lib/support/CodeUtils.h>

namespace provisioning
{

bool NetworkList::Find(chip::ByteSpan ssid, size_t & index) const
{
    for (size_t i = 0; i < mSize; i++)
    {
        if (mEntries[i].ssid.Equals(ssid))
        {
            index = i;
            return true;
        }
    }
    return false;
}

CHIP_ERROR NetworkList::Append(const WiFiCredentials & entry)
{
    VerifyOrReturnError(mSize < kCapacity, CHIP_ERROR_NO_MEMORY);
    mEntries[mSize++] = entry;
    return CHIP_NO_ERROR;
}

CHIP_ERROR NetworkList::RemoveAt(size_t index)
{
    VerifyOrReturnError(index < mSize, CHIP_ERROR_INVALID_ARGUMENT);
    for (size_t i = index; i + 1 < mSize; i++)
    {
        mEntries[i] = mEntries[i + 1];
    }
    mSize--;
    return CHIP_NO_ERROR;
}

CHIP_ERROR NetworkList::Move(size_t from, size_t to)
{
    VerifyOrReturnError(from < mSize && to < mSize, CHIP_ERROR_INVALID_ARGUMENT);

    WiFiCredentials entry = mEntries[from];
    if (from < to)
    {
        for (size_t i = from; i < to; i++)
        {
            mEntries[i] = mEntries[i + 1];
        }
    }
    else
    {
        for (size_t i = from; i > to; i--)
        {
            mEntries[i] = mEntries[i - 1];
        }
    }
    mEntries[to] = entry;
    return CHIP_NO_ERROR;
}

} // namespace provisioning
