#include "matter/wifi_commissioning_server.h"

#include "matter/commissioning_events.h"

#include <app/AttributeAccessInterfaceRegistry.h>
#include <app/CommandHandlerInterfaceRegistry.h>
#include <app/reporting/reporting.h>
#include <app/server/Server.h>
#include <lib/support/CodeUtils.h>
#include <lib/support/logging/CHIPLogging.h>
#include <platform/CHIPDeviceLayer.h>

using namespace chip;
using namespace chip::app;
using namespace chip::app::Clusters;
using chip::Protocols::InteractionModel::Status;

namespace matter
{

WiFiCommissioningServer::WiFiCommissioningServer(WiFiCommissioningCluster & cluster, provisioning::NetworkContext & context,
                                                 EndpointId endpoint) :
    AttributeAccessInterface(MakeOptional(endpoint), NetworkCommissioning::Id),
    CommandHandlerInterface(MakeOptional(endpoint), NetworkCommissioning::Id), mCluster(cluster), mContext(context),
    mEndpoint(endpoint)
{}

CHIP_ERROR WiFiCommissioningServer::Register()
{
    VerifyOrReturnError(AttributeAccessInterfaceRegistry::Instance().Register(this), CHIP_ERROR_INCORRECT_STATE);
    ReturnErrorOnFailure(CommandHandlerInterfaceRegistry::Instance().RegisterCommandHandler(this));
    ReturnErrorOnFailure(DeviceLayer::PlatformMgr().AddEventHandler(DeviceEventHandler, reinterpret_cast<intptr_t>(this)));

    mCluster.SetDelegate(this);
    mContext.SetObserver(this);
    return CHIP_NO_ERROR;
}

CHIP_ERROR WiFiCommissioningServer::Read(const ConcreteReadAttributePath & path, AttributeValueEncoder & encoder)
{
    using namespace NetworkCommissioning::Attributes;

    VerifyOrReturnError(path.mClusterId == NetworkCommissioning::Id, CHIP_ERROR_INVALID_ARGUMENT);

    switch (path.mAttributeId)
    {
    case MaxNetworks::Id:
        return encoder.Encode(mCluster.MaxNetworks());
    case Networks::Id:
        return ReadNetworks(encoder);
    case ScanMaxTimeSeconds::Id:
        return encoder.Encode(WiFiCommissioningCluster::kScanMaxTimeSeconds);
    case ConnectMaxTimeSeconds::Id:
        return encoder.Encode(WiFiCommissioningCluster::kConnectMaxTimeSeconds);
    case InterfaceEnabled::Id:
        return encoder.Encode(true);
    case LastNetworkingStatus::Id:
    case LastNetworkID::Id:
    case LastConnectErrorValue::Id:
        return ReadLastStatus(path.mAttributeId, encoder);
    case FeatureMap::Id:
        return encoder.Encode(static_cast<uint32_t>(NetworkCommissioning::Feature::kWiFiNetworkInterface));
    default:
        break;
    }

    return CHIP_NO_ERROR;
}

CHIP_ERROR WiFiCommissioningServer::ReadNetworks(AttributeValueEncoder & encoder)
{
    WiFiCommissioningCluster::AttributeSnapshot snapshot;
    mCluster.ReadState(snapshot);

    return encoder.EncodeList([&snapshot](const auto & listEncoder) -> CHIP_ERROR {
        for (size_t i = 0; i < snapshot.networkCount; i++)
        {
            NetworkCommissioning::Structs::NetworkInfoStruct::Type info;
            info.networkID = snapshot.networks[i].ssid.Span();
            info.connected = snapshot.networks[i].connected;
            ReturnErrorOnFailure(listEncoder.Encode(info));
        }
        return CHIP_NO_ERROR;
    });
}

CHIP_ERROR WiFiCommissioningServer::ReadLastStatus(AttributeId attribute, AttributeValueEncoder & encoder)
{
    using namespace NetworkCommissioning::Attributes;

    WiFiCommissioningCluster::AttributeSnapshot snapshot;
    mCluster.ReadState(snapshot);

    VerifyOrReturnError(snapshot.lastStatus.HasValue(), encoder.EncodeNull());
    const provisioning::ConnectionStatus & status = snapshot.lastStatus.Value();

    switch (attribute)
    {
    case LastNetworkingStatus::Id:
        return encoder.Encode(status.status);
    case LastNetworkID::Id:
        return encoder.Encode(status.ssid.Span());
    default:
        return encoder.Encode(status.value);
    }
}

void WiFiCommissioningServer::InvokeCommand(HandlerContext & context)
{
    using namespace NetworkCommissioning::Commands;

    switch (context.mRequestPath.mCommandId)
    {
    case ScanNetworks::Id:
        HandleCommand<ScanNetworks::DecodableType>(
            context, [this](HandlerContext & ctx, const auto & request) { HandleScanNetworks(ctx, request); });
        return;
    case AddOrUpdateWiFiNetwork::Id:
        HandleCommand<AddOrUpdateWiFiNetwork::DecodableType>(
            context, [this](HandlerContext & ctx, const auto & request) { HandleAddOrUpdateWiFiNetwork(ctx, request); });
        return;
    case RemoveNetwork::Id:
        HandleCommand<RemoveNetwork::DecodableType>(
            context, [this](HandlerContext & ctx, const auto & request) { HandleRemoveNetwork(ctx, request); });
        return;
    case ConnectNetwork::Id:
        HandleCommand<ConnectNetwork::DecodableType>(
            context, [this](HandlerContext & ctx, const auto & request) { HandleConnectNetwork(ctx, request); });
        return;
    case ReorderNetwork::Id:
        HandleCommand<ReorderNetwork::DecodableType>(
            context, [this](HandlerContext & ctx, const auto & request) { HandleReorderNetwork(ctx, request); });
        return;
    default:
        return;
    }
}

bool WiFiCommissioningServer::CheckFailSafeArmed(HandlerContext & context)
{
    if (!IS_ENABLED(CONFIG_NETPROV_REQUIRE_FAILSAFE))
    {
        return true;
    }

    auto & failSafe = Server::GetInstance().GetFailSafeContext();
    if (failSafe.IsFailSafeArmed(context.mCommandHandler.GetAccessingFabricIndex()))
    {
        return true;
    }

    ChipLogError(AppServer, "Network Commissioning command 0x%02x rejected: fail-safe not armed",
                 static_cast<unsigned>(context.mRequestPath.mCommandId));
    context.mCommandHandler.AddStatus(context.mRequestPath, Status::FailsafeRequired);
    return false;
}

void WiFiCommissioningServer::SendNetworkConfigResponse(HandlerContext & context, WiFiCommissioningCluster::Status status,
                                                        const WiFiCommissioningCluster::NetworkConfigResult & result)
{
    if (status != Status::Success)
    {
        context.mCommandHandler.AddStatus(context.mRequestPath, status);
        return;
    }

    NetworkCommissioning::Commands::NetworkConfigResponse::Type response;
    response.networkingStatus = result.status;
    response.networkIndex     = result.networkIndex;
    context.mCommandHandler.AddResponse(context.mRequestPath, response);
}

void WiFiCommissioningServer::HandleScanNetworks(HandlerContext & context,
                                                 const NetworkCommissioning::Commands::ScanNetworks::DecodableType &)
{
    context.mCommandHandler.AddStatus(context.mRequestPath, mCluster.ScanNetworks());
}

void WiFiCommissioningServer::HandleAddOrUpdateWiFiNetwork(
    HandlerContext & context, const NetworkCommissioning::Commands::AddOrUpdateWiFiNetwork::DecodableType & request)
{
    VerifyOrReturn(CheckFailSafeArmed(context));

    WiFiCommissioningCluster::NetworkConfigResult result;
    SendNetworkConfigResponse(context, mCluster.AddOrUpdateNetwork(request.ssid, request.credentials, result), result);
}

void WiFiCommissioningServer::HandleRemoveNetwork(HandlerContext & context,
                                                  const NetworkCommissioning::Commands::RemoveNetwork::DecodableType & request)
{
    VerifyOrReturn(CheckFailSafeArmed(context));

    WiFiCommissioningCluster::NetworkConfigResult result;
    SendNetworkConfigResponse(context, mCluster.RemoveNetwork(request.networkID, result), result);
}

void WiFiCommissioningServer::HandleConnectNetwork(HandlerContext & context,
                                                   const NetworkCommissioning::Commands::ConnectNetwork::DecodableType & request)
{
    VerifyOrReturn(CheckFailSafeArmed(context));

    Status status = mCluster.ConnectNetwork(request.networkID);
    if (status != Status::Success)
    {
        context.mCommandHandler.AddStatus(context.mRequestPath, status);
        return;
    }

    // The device switches to its operational network; the commissioner sees
    // the BLE session go away instead of a ConnectNetworkResponse.
    context.mCommandHandler.FlushAcksRightAwayOnSlowCommand();
    mPendingConnect = CommandHandler::Handle(&context.mCommandHandler);
}

void WiFiCommissioningServer::HandleReorderNetwork(HandlerContext & context,
                                                   const NetworkCommissioning::Commands::ReorderNetwork::DecodableType & request)
{
    VerifyOrReturn(CheckFailSafeArmed(context));

    WiFiCommissioningCluster::NetworkConfigResult result;
    SendNetworkConfigResponse(context, mCluster.ReorderNetwork(request.networkID, request.networkIndex, result), result);
}

void WiFiCommissioningServer::OnCommandCompleted(bool networksChanged)
{
    // Marking an attribute dirty is what advances the cluster data version
    // served for this endpoint, so commands that changed nothing still do it.
    MatterReportingAttributeChangeCallback(mEndpoint, NetworkCommissioning::Id, NetworkCommissioning::Attributes::Networks::Id);
    if (networksChanged)
    {
        ChipLogProgress(AppServer, "Network list changed");
    }
}

void WiFiCommissioningServer::OnStatusChanged()
{
    // Status comes from the network manager thread; reports must be raised
    // from the Matter event loop.
    CHIP_ERROR err = DeviceLayer::PlatformMgr().ScheduleWork(ReportStatusAttributes, reinterpret_cast<intptr_t>(this));
    if (err != CHIP_NO_ERROR)
    {
        ChipLogError(AppServer, "Failed to schedule status report: %s", ErrorStr(err));
    }
}

void WiFiCommissioningServer::DeviceEventHandler(const DeviceLayer::ChipDeviceEvent * event, intptr_t arg)
{
    auto * self = reinterpret_cast<WiFiCommissioningServer *>(arg);

    if (EndsCommissioningSession(*event) && self->mPendingConnect.Get() != nullptr)
    {
        ChipLogProgress(AppServer, "Releasing unanswered ConnectNetwork");
        self->mPendingConnect.Release();
    }
}

void WiFiCommissioningServer::ReportStatusAttributes(intptr_t arg)
{
    using namespace NetworkCommissioning::Attributes;

    auto * self = reinterpret_cast<WiFiCommissioningServer *>(arg);
    MatterReportingAttributeChangeCallback(self->mEndpoint, NetworkCommissioning::Id, LastNetworkingStatus::Id);
    MatterReportingAttributeChangeCallback(self->mEndpoint, NetworkCommissioning::Id, LastNetworkID::Id);
    MatterReportingAttributeChangeCallback(self->mEndpoint, NetworkCommissioning::Id, LastConnectErrorValue::Id);
    MatterReportingAttributeChangeCallback(self->mEndpoint, NetworkCommissioning::Id, Networks::Id);
}

} // namespace matter
