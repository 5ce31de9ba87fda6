#ifndef SETTINGS_CONTROLLER_H
#define SETTINGS_CONTROLLER_H

#include "config_store.h"
#include "indicator_host.h"
#include "refresh_scheduler.h"

#include <string>

class SettingsController {
public:
    SettingsController(ConfigStore& config, RefreshScheduler& scheduler, IndicatorHost& host);

    // Persist new settings, restart the timer and refresh once.
    void apply(const std::string& new_credential, const std::string& new_interval_raw);

    // Show the settings dialog; applies on accept. Returns false on cancel.
    bool edit();

private:
    ConfigStore& config_;
    RefreshScheduler& scheduler_;
    IndicatorHost& host_;
};

// Integer text to poll interval: unparsable gives the default, small values
// clamp to the minimum.
int parse_poll_interval(const std::string& raw);

#endif // SETTINGS_CONTROLLER_H
