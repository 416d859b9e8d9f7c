#include "app/orchestrator.h"
#include "cfg/app_config.h"
#include "connectivity/ble_manager.h"
#include "connectivity/wifi_station.h"
#include "matter/server_runtime.h"
#include "matter/wifi_commissioning_cluster.h"
#include "matter/wifi_commissioning_server.h"
#include "runtime/cancel_token.h"

#include <DeviceInfoProviderImpl.h>
#include <app/server/OnboardingCodesUtil.h>
#include <app/server/Server.h>
#include <credentials/DeviceAttestationCredsProvider.h>
#include <credentials/examples/DeviceAttestationCredsExample.h>
#include <data-model-providers/codegen/Instance.h>
#include <lib/core/CHIPError.h>
#include <lib/core/ErrorStr.h>
#include <lib/support/CodeUtils.h>
#include <platform/CHIPDeviceLayer.h>
#include <platform/ConfigurationManager.h>
#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

LOG_MODULE_REGISTER(netprov_app, LOG_LEVEL_INF);

using namespace chip;
using namespace chip::DeviceLayer;

namespace
{

chip::DeviceLayer::DeviceInfoProviderImpl gExampleDeviceInfoProvider;
runtime::CancelToken gRootToken;

CHIP_ERROR InitServer(PersistentStorageDelegate *& storage)
{
    static chip::CommonCaseDeviceServerInitParams sInitParams;
    ReturnErrorOnFailure(sInitParams.InitializeStaticResourcesBeforeServerInit());

    sInitParams.dataModelProvider = chip::app::CodegenDataModelProviderInstance(sInitParams.persistentStorageDelegate);
    ReturnErrorOnFailure(Server::GetInstance().Init(sInitParams));

    storage = sInitParams.persistentStorageDelegate;
    return CHIP_NO_ERROR;
}

} // namespace

extern "C" int main(void)
{
    LOG_INF("Network provisioning app started.");

    int settingsStatus = cfg::app_config::InitSettings();
    if (settingsStatus)
    {
        LOG_ERR("settings_subsys_init failed: %d", settingsStatus);
        return 0;
    }

    CHIP_ERROR err = PlatformMgr().InitChipStack();
    if (err != CHIP_NO_ERROR)
    {
        LOG_ERR("InitChipStack failed: %s (%" CHIP_ERROR_FORMAT ")", chip::ErrorStr(err), err.Format());
        return 0;
    }

    // Development Device Attestation Credentials
    Credentials::SetDeviceAttestationCredentialsProvider(Credentials::Examples::GetExampleDACProvider());

    cfg::app_config::ConfigureBasicInformation();
    PlatformMgr().AddEventHandler(connectivity::BleCommissioningChannel::AppEventHandler, 0);

    // Load Zephyr settings now that CHIP stack (and BT) are initialized.
    cfg::app_config::LoadSettingsIfEnabled();

    PersistentStorageDelegate * storage = nullptr;
    err                                 = InitServer(storage);
    if (err != CHIP_NO_ERROR)
    {
        LOG_ERR("Matter Server init failed: %s (%" CHIP_ERROR_FORMAT ")", chip::ErrorStr(err), err.Format());
        return -2;
    }

    gExampleDeviceInfoProvider.SetStorageDelegate(storage);
    DeviceLayer::SetDeviceInfoProvider(&gExampleDeviceInfoProvider);

    err = matter::ServerRuntime::Instance().Init();
    if (err != CHIP_NO_ERROR)
    {
        LOG_ERR("Server runtime init failed: %" CHIP_ERROR_FORMAT, err.Format());
        return -3;
    }

    const ::app::Orchestrator::Config config = { cfg::app_config::DeviceName(),
                                                 cfg::app_config::CommissioningWindowTimeout() };
    static ::app::Orchestrator sOrchestrator(*storage, connectivity::WiFiStation::Instance(),
                                             connectivity::BleCommissioningChannel::Instance(),
                                             matter::ServerRuntime::Instance(), config);
    static matter::WiFiCommissioningCluster sCluster(sOrchestrator.Context());
    static matter::WiFiCommissioningServer sClusterServer(sCluster, sOrchestrator.Context());

    err = sClusterServer.Register();
    if (err != CHIP_NO_ERROR)
    {
        LOG_ERR("Network Commissioning registration failed: %" CHIP_ERROR_FORMAT, err.Format());
        return -4;
    }

    err = sOrchestrator.Init();
    if (err != CHIP_NO_ERROR)
    {
        LOG_ERR("Orchestrator init failed: %" CHIP_ERROR_FORMAT, err.Format());
        return -5;
    }

    ConfigurationMgr().LogDeviceConfig();
    PrintOnboardingCodes(chip::RendezvousInformationFlags(chip::RendezvousInformationFlag::kBLE));

    err = PlatformMgr().StartEventLoopTask();
    if (err != CHIP_NO_ERROR)
    {
        LOG_ERR("StartEventLoopTask failed: %" CHIP_ERROR_FORMAT, err.Format());
        return -6;
    }

    err = sOrchestrator.Run(gRootToken);
    LOG_ERR("Orchestrator stopped: %" CHIP_ERROR_FORMAT, err.Format());
    return 0;
}
