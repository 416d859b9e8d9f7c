#include "provisioning/network_store.h"

#include <lib/core/TLV.h>
#include <lib/support/CodeUtils.h>

#include <algorithm>
#include <limits>

namespace provisioning
{

namespace
{

constexpr uint8_t kTagVersion  = 0;
constexpr uint8_t kTagNetworks = 1;
constexpr uint8_t kTagSsid     = 0;
constexpr uint8_t kTagPassword = 1;

CHIP_ERROR ReadEntry(chip::TLV::TLVReader & reader, WiFiCredentials & entry)
{
    chip::TLV::TLVType container;
    chip::ByteSpan value;

    VerifyOrReturnError(reader.GetType() == chip::TLV::kTLVType_Structure, CHIP_ERROR_WRONG_TLV_TYPE);
    ReturnErrorOnFailure(reader.EnterContainer(container));

    ReturnErrorOnFailure(reader.Next(chip::TLV::kTLVType_ByteString, chip::TLV::ContextTag(kTagSsid)));
    ReturnErrorOnFailure(reader.Get(value));
    VerifyOrReturnError(!value.empty(), CHIP_ERROR_INVALID_TLV_ELEMENT);
    ReturnErrorOnFailure(entry.ssid.Set(value));

    ReturnErrorOnFailure(reader.Next(chip::TLV::kTLVType_ByteString, chip::TLV::ContextTag(kTagPassword)));
    ReturnErrorOnFailure(reader.Get(value));
    ReturnErrorOnFailure(entry.password.Set(value));

    return reader.ExitContainer(container);
}

} // namespace

CHIP_ERROR NetworkStore::Save(const NetworkList & networks, chip::MutableByteSpan buffer)
{
    chip::TLV::TLVWriter writer;
    chip::TLV::TLVType outer;
    chip::TLV::TLVType array;

    writer.Init(buffer.data(), std::min<size_t>(buffer.size(), std::numeric_limits<uint16_t>::max()));

    ReturnErrorOnFailure(writer.StartContainer(chip::TLV::AnonymousTag(), chip::TLV::kTLVType_Structure, outer));
    ReturnErrorOnFailure(writer.Put(chip::TLV::ContextTag(kTagVersion), kFormatVersion));
    ReturnErrorOnFailure(writer.StartContainer(chip::TLV::ContextTag(kTagNetworks), chip::TLV::kTLVType_Array, array));

    for (const auto & entry : networks)
    {
        chip::TLV::TLVType item;
        ReturnErrorOnFailure(writer.StartContainer(chip::TLV::AnonymousTag(), chip::TLV::kTLVType_Structure, item));
        ReturnErrorOnFailure(writer.Put(chip::TLV::ContextTag(kTagSsid), entry.ssid.Span()));
        ReturnErrorOnFailure(writer.Put(chip::TLV::ContextTag(kTagPassword), entry.password.Span()));
        ReturnErrorOnFailure(writer.EndContainer(item));
    }

    ReturnErrorOnFailure(writer.EndContainer(array));
    ReturnErrorOnFailure(writer.EndContainer(outer));
    ReturnErrorOnFailure(writer.Finalize());

    return mStorage.SyncSetKeyValue(kStorageKey, buffer.data(), static_cast<uint16_t>(writer.GetLengthWritten()));
}

CHIP_ERROR NetworkStore::Load(NetworkList & networks, chip::MutableByteSpan buffer)
{
    uint16_t size  = static_cast<uint16_t>(std::min<size_t>(buffer.size(), std::numeric_limits<uint16_t>::max()));
    CHIP_ERROR err = mStorage.SyncGetKeyValue(kStorageKey, buffer.data(), size);
    if (err == CHIP_ERROR_PERSISTED_STORAGE_VALUE_NOT_FOUND)
    {
        networks.Clear();
        return CHIP_NO_ERROR;
    }
    ReturnErrorOnFailure(err);

    chip::TLV::TLVReader reader;
    chip::TLV::TLVType outer;
    chip::TLV::TLVType array;
    uint8_t version = 0;
    NetworkList loaded;

    reader.Init(buffer.data(), size);
    ReturnErrorOnFailure(reader.Next(chip::TLV::kTLVType_Structure, chip::TLV::AnonymousTag()));
    ReturnErrorOnFailure(reader.EnterContainer(outer));

    ReturnErrorOnFailure(reader.Next(chip::TLV::ContextTag(kTagVersion)));
    ReturnErrorOnFailure(reader.Get(version));
    VerifyOrReturnError(version == kFormatVersion, CHIP_ERROR_VERSION_MISMATCH);

    ReturnErrorOnFailure(reader.Next(chip::TLV::kTLVType_Array, chip::TLV::ContextTag(kTagNetworks)));
    ReturnErrorOnFailure(reader.EnterContainer(array));

    while ((err = reader.Next()) == CHIP_NO_ERROR)
    {
        WiFiCredentials entry;
        size_t existing;
        ReturnErrorOnFailure(ReadEntry(reader, entry));
        VerifyOrReturnError(!loaded.Find(entry.ssid.Span(), existing), CHIP_ERROR_INVALID_TLV_ELEMENT);
        ReturnErrorOnFailure(loaded.Append(entry));
    }
    VerifyOrReturnError(err == CHIP_END_OF_TLV, err);

    ReturnErrorOnFailure(reader.ExitContainer(array));
    ReturnErrorOnFailure(reader.ExitContainer(outer));

    networks = loaded;
    return CHIP_NO_ERROR;
}

} // namespace provisioning
