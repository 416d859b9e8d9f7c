#include "matter/wifi_commissioning_cluster.h"

#include <lib/support/CodeUtils.h>
#include <lib/support/logging/CHIPLogging.h>
#include <zephyr/sys/util.h>

using chip::ByteSpan;
using chip::MakeOptional;
using chip::NullOptional;
using provisioning::WiFiCredentials;

namespace matter
{

namespace
{

bool ParseCredentials(ByteSpan ssid, ByteSpan password, WiFiCredentials & credentials)
{
    if (ssid.empty())
    {
        return false;
    }
    return credentials.ssid.Set(ssid) == CHIP_NO_ERROR && credentials.password.Set(password) == CHIP_NO_ERROR;
}

bool IsValidNetworkId(ByteSpan networkId)
{
    return !networkId.empty() && networkId.size() <= provisioning::kMaxSsidLength;
}

} // namespace

WiFiCommissioningCluster::WiFiCommissioningCluster(provisioning::NetworkContext & context) :
    mContext(context),
    mIndexConvention(IS_ENABLED(CONFIG_NETPROV_ADD_REPORTS_NETWORK_COUNT) ? IndexConvention::kNetworkCount
                                                                          : IndexConvention::kEntryPosition)
{}

void WiFiCommissioningCluster::CompleteCommand(bool networksChanged)
{
    if (mDelegate != nullptr)
    {
        mDelegate->OnCommandCompleted(networksChanged);
    }
}

void WiFiCommissioningCluster::ReadState(AttributeSnapshot & snapshot)
{
    auto state = mContext.Lock();

    snapshot.lastStatus   = state->status;
    snapshot.networkCount = state->networks.Size();

    for (size_t i = 0; i < snapshot.networkCount; i++)
    {
        const auto & entry              = state->networks[i];
        snapshot.networks[i].ssid      = entry.ssid;
        snapshot.networks[i].connected = state->status.HasValue() && state->status.Value().ssid == entry.ssid &&
            state->status.Value().status == NetworkStatus::kSuccess;
    }
}

WiFiCommissioningCluster::Status WiFiCommissioningCluster::ScanNetworks()
{
    ChipLogProgress(AppServer, "ScanNetworks: not supported, reporting busy");
    CompleteCommand(false);
    return Status::Busy;
}

WiFiCommissioningCluster::Status WiFiCommissioningCluster::AddOrUpdateNetwork(ByteSpan ssid, ByteSpan credentials,
                                                                              NetworkConfigResult & result)
{
    WiFiCredentials entry;
    if (!ParseCredentials(ssid, credentials, entry))
    {
        ChipLogError(AppServer, "AddOrUpdateWiFiNetwork: ssid %u bytes, credentials %u bytes out of bounds",
                     static_cast<unsigned>(ssid.size()), static_cast<unsigned>(credentials.size()));
        CompleteCommand(false);
        return Status::ConstraintError;
    }

    bool changed = false;
    {
        auto state = mContext.Lock();
        size_t index;

        if (state->networks.Find(ssid, index))
        {
            state->networks[index].password = entry.password;
            state->MarkChanged();
            result.status       = NetworkStatus::kSuccess;
            result.networkIndex = MakeOptional(static_cast<uint8_t>(index));
            changed             = true;
        }
        else if (state->networks.Append(entry) == CHIP_NO_ERROR)
        {
            const size_t count = state->networks.Size();
            state->MarkChanged();
            result.status       = NetworkStatus::kSuccess;
            result.networkIndex = MakeOptional(
                static_cast<uint8_t>(mIndexConvention == IndexConvention::kNetworkCount ? count : count - 1));
            changed = true;
        }
        else
        {
            result.status       = NetworkStatus::kBoundsExceeded;
            result.networkIndex = NullOptional;
        }
    }

    CompleteCommand(changed);
    return Status::Success;
}

WiFiCommissioningCluster::Status WiFiCommissioningCluster::RemoveNetwork(ByteSpan networkId, NetworkConfigResult & result)
{
    if (!IsValidNetworkId(networkId))
    {
        CompleteCommand(false);
        return Status::ConstraintError;
    }

    bool changed = false;
    {
        auto state = mContext.Lock();
        size_t index;

        if (state->networks.Find(networkId, index) && state->networks.RemoveAt(index) == CHIP_NO_ERROR)
        {
            state->MarkChanged();
            result.status       = NetworkStatus::kSuccess;
            result.networkIndex = MakeOptional(static_cast<uint8_t>(index));
            changed             = true;
        }
        else
        {
            result.status       = NetworkStatus::kNetworkIDNotFound;
            result.networkIndex = NullOptional;
        }
    }

    CompleteCommand(changed);
    return Status::Success;
}

WiFiCommissioningCluster::Status WiFiCommissioningCluster::ConnectNetwork(ByteSpan networkId)
{
    VerifyOrReturnValue(IsValidNetworkId(networkId), Status::ConstraintError, CompleteCommand(false));

    // The request is recorded even for unknown networks; the network manager
    // reports NetworkIDNotFound through LastNetworkingStatus.
    VerifyOrReturnValue(mContext.RequestConnect(networkId) == CHIP_NO_ERROR, Status::Failure, CompleteCommand(false));
    ChipLogProgress(AppServer, "ConnectNetwork requested");
    return Status::Success;
}

WiFiCommissioningCluster::Status WiFiCommissioningCluster::ReorderNetwork(ByteSpan networkId, uint8_t networkIndex,
                                                                          NetworkConfigResult & result)
{
    if (!IsValidNetworkId(networkId))
    {
        CompleteCommand(false);
        return Status::ConstraintError;
    }

    bool changed = false;
    {
        auto state = mContext.Lock();
        size_t index;

        if (!state->networks.Find(networkId, index))
        {
            result.status       = NetworkStatus::kNetworkIDNotFound;
            result.networkIndex = NullOptional;
        }
        else if (networkIndex >= state->networks.Size())
        {
            result.status       = NetworkStatus::kOutOfRange;
            result.networkIndex = MakeOptional(networkIndex);
        }
        else if (state->networks.Move(index, networkIndex) == CHIP_NO_ERROR)
        {
            state->MarkChanged();
            result.status       = NetworkStatus::kSuccess;
            result.networkIndex = MakeOptional(networkIndex);
            changed             = true;
        }
        else
        {
            result.status       = NetworkStatus::kUnknownError;
            result.networkIndex = NullOptional;
        }
    }

    CompleteCommand(changed);
    return Status::Success;
}

} // namespace matter
