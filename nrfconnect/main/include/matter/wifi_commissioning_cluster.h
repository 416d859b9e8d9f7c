#pragma once

#include "provisioning/network_context.h"
#include "provisioning/wifi_credentials.h"

#include <lib/core/DataModelTypes.h>
#include <lib/core/Optional.h>
#include <lib/support/Span.h>
#include <protocols/interaction_model/StatusCode.h>

#include <cstddef>
#include <cstdint>

namespace matter
{

/**
 * Network Commissioning (Wi-Fi) command and attribute semantics over the
 * shared NetworkContext. Knows nothing about the Interaction Model plumbing;
 * see WiFiCommissioningServer for that.
 *
 * Command handlers return the IM status of the invoke. When it is Success the
 * NetworkConfigResponse payload is in `result`.
 */
class WiFiCommissioningCluster
{
public:
    using Status        = chip::Protocols::InteractionModel::Status;
    using NetworkStatus = provisioning::NetworkStatus;

    // What AddOrUpdateWiFiNetwork reports as NetworkIndex for a new entry.
    enum class IndexConvention : uint8_t
    {
        kEntryPosition, // 0-based position of the new entry
        kNetworkCount,  // length of the list after the insertion
    };

    static constexpr uint8_t kScanMaxTimeSeconds    = 30;
    static constexpr uint8_t kConnectMaxTimeSeconds = 60;

    struct NetworkConfigResult
    {
        NetworkStatus status = NetworkStatus::kSuccess;
        chip::Optional<uint8_t> networkIndex;
    };

    struct NetworkEntry
    {
        provisioning::Ssid ssid;
        bool connected = false;
    };

    struct AttributeSnapshot
    {
        NetworkEntry networks[provisioning::NetworkList::kCapacity];
        size_t networkCount = 0;
        chip::Optional<provisioning::ConnectionStatus> lastStatus;
    };

    class Delegate
    {
    public:
        virtual ~Delegate() = default;

        // Called once per completed command, without the context lock held.
        // The delegate owns the cluster data version clients read and must
        // advance it on every call.
        virtual void OnCommandCompleted(bool networksChanged) = 0;
    };

    explicit WiFiCommissioningCluster(provisioning::NetworkContext & context);

    void SetDelegate(Delegate * delegate) { mDelegate = delegate; }
    void SetIndexConvention(IndexConvention convention) { mIndexConvention = convention; }

    uint8_t MaxNetworks() const { return static_cast<uint8_t>(provisioning::NetworkList::kCapacity); }

    // Copies the list and last status in one locked pass.
    void ReadState(AttributeSnapshot & snapshot);

    Status ScanNetworks();
    Status AddOrUpdateNetwork(chip::ByteSpan ssid, chip::ByteSpan credentials, NetworkConfigResult & result);
    Status RemoveNetwork(chip::ByteSpan networkId, NetworkConfigResult & result);
    // Success means the request was recorded; no response must be sent for it.
    Status ConnectNetwork(chip::ByteSpan networkId);
    Status ReorderNetwork(chip::ByteSpan networkId, uint8_t networkIndex, NetworkConfigResult & result);

private:
    void CompleteCommand(bool networksChanged);

    provisioning::NetworkContext & mContext;
    Delegate * mDelegate = nullptr;
    IndexConvention mIndexConvention;
};

} // namespace matter
