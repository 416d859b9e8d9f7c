#pragma once

#include "matter/wifi_commissioning_cluster.h"
#include "provisioning/network_context.h"

#include <app-common/zap-generated/cluster-objects.h>
#include <app/AttributeAccessInterface.h>
#include <app/AttributeValueEncoder.h>
#include <app/CommandHandler.h>
#include <app/CommandHandlerInterface.h>
#include <app/ConcreteAttributePath.h>
#include <lib/core/CHIPError.h>
#include <lib/core/DataModelTypes.h>
#include <platform/CHIPDeviceEvent.h>

namespace matter
{

/**
 * Binds WiFiCommissioningCluster to the Interaction Model on the root endpoint:
 * attribute reads, the five Wi-Fi commands and change reporting.
 */
class WiFiCommissioningServer : public chip::app::AttributeAccessInterface,
                                public chip::app::CommandHandlerInterface,
                                public WiFiCommissioningCluster::Delegate,
                                public provisioning::NetworkContext::Observer
{
public:
    WiFiCommissioningServer(WiFiCommissioningCluster & cluster, provisioning::NetworkContext & context,
                            chip::EndpointId endpoint = 0);

    CHIP_ERROR Register();

    CHIP_ERROR Read(const chip::app::ConcreteReadAttributePath & path, chip::app::AttributeValueEncoder & encoder) override;
    void InvokeCommand(HandlerContext & context) override;

    void OnCommandCompleted(bool networksChanged) override;
    void OnStatusChanged() override;

private:
    CHIP_ERROR ReadNetworks(chip::app::AttributeValueEncoder & encoder);
    CHIP_ERROR ReadLastStatus(chip::AttributeId attribute, chip::app::AttributeValueEncoder & encoder);

    bool CheckFailSafeArmed(HandlerContext & context);
    void SendNetworkConfigResponse(HandlerContext & context, WiFiCommissioningCluster::Status status,
                                   const WiFiCommissioningCluster::NetworkConfigResult & result);

    void HandleScanNetworks(HandlerContext & context,
                            const chip::app::Clusters::NetworkCommissioning::Commands::ScanNetworks::DecodableType & request);
    void HandleAddOrUpdateWiFiNetwork(
        HandlerContext & context,
        const chip::app::Clusters::NetworkCommissioning::Commands::AddOrUpdateWiFiNetwork::DecodableType & request);
    void HandleRemoveNetwork(HandlerContext & context,
                             const chip::app::Clusters::NetworkCommissioning::Commands::RemoveNetwork::DecodableType & request);
    void HandleConnectNetwork(HandlerContext & context,
                              const chip::app::Clusters::NetworkCommissioning::Commands::ConnectNetwork::DecodableType & request);
    void HandleReorderNetwork(HandlerContext & context,
                              const chip::app::Clusters::NetworkCommissioning::Commands::ReorderNetwork::DecodableType & request);

    static void ReportStatusAttributes(intptr_t arg);
    static void DeviceEventHandler(const chip::DeviceLayer::ChipDeviceEvent * event, intptr_t arg);

    WiFiCommissioningCluster & mCluster;
    provisioning::NetworkContext & mContext;
    chip::EndpointId mEndpoint;
    // Kept open so ConnectNetwork never gets a response. Released when the
    // commissioning session ends or the next ConnectNetwork arrives.
    chip::app::CommandHandler::Handle mPendingConnect;
};

} // namespace matter
