#include "cfg/app_config.h"

#include <platform/CHIPDeviceLayer.h>
#include <platform/ConfigurationManager.h>
#include <zephyr/logging/log.h>
#include <zephyr/settings/settings.h>

LOG_MODULE_DECLARE(netprov_app, LOG_LEVEL_INF);

namespace cfg
{
namespace app_config
{

int InitSettings()
{
    return settings_subsys_init();
}

void LoadSettingsIfEnabled()
{
    if (IS_ENABLED(CONFIG_BT_SETTINGS))
    {
        int rc = settings_load();
        if (rc != 0)
        {
            LOG_WRN("settings_load failed: %d", rc);
        }
    }
}

void ConfigureBasicInformation()
{
    constexpr char kDefaultCountryCode[] = CONFIG_CHIP_DEVICE_COUNTRY_CODE;
    static_assert(sizeof(kDefaultCountryCode) > 1, "CONFIG_CHIP_DEVICE_COUNTRY_CODE must not be empty");
    static_assert(sizeof(kDefaultCountryCode) - 1 <= chip::DeviceLayer::ConfigurationManager::kMaxLocationLength,
                  "CONFIG_CHIP_DEVICE_COUNTRY_CODE exceeds the maximum Basic Information country code length");
    char countryCode[chip::DeviceLayer::ConfigurationManager::kMaxLocationLength + 1] = {};
    size_t codeLen                                                                   = 0;
    CHIP_ERROR locationErr = chip::DeviceLayer::ConfigurationMgr().GetCountryCode(countryCode, sizeof(countryCode), codeLen);

    if ((locationErr != CHIP_NO_ERROR) || (codeLen != sizeof(kDefaultCountryCode) - 1))
    {
        // Only populate a default when nothing has been provisioned yet.
        if (chip::DeviceLayer::ConfigurationMgr().StoreCountryCode(kDefaultCountryCode, sizeof(kDefaultCountryCode) - 1) !=
            CHIP_NO_ERROR)
        {
            LOG_WRN("Failed to persist default country code");
        }
    }
}

const char * DeviceName()
{
    return CONFIG_NETPROV_DEVICE_NAME;
}

chip::System::Clock::Seconds32 CommissioningWindowTimeout()
{
    return chip::System::Clock::Seconds32(CONFIG_NETPROV_COMMISSIONING_WINDOW_TIMEOUT_SEC);
}

} // namespace app_config
} // namespace cfg
