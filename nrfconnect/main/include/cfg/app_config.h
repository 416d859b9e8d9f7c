#pragma once

#include <lib/core/CHIPError.h>
#include <system/SystemClock.h>

namespace cfg
{
namespace app_config
{

int InitSettings();
void LoadSettingsIfEnabled();
void ConfigureBasicInformation();

// Prefix of the BLE advertising name.
const char * DeviceName();
chip::System::Clock::Seconds32 CommissioningWindowTimeout();

} // namespace app_config
} // namespace cfg
