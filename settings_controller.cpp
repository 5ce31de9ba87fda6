#include "settings_controller.h"

#include <climits>

SettingsController::SettingsController(ConfigStore& config, RefreshScheduler& scheduler, IndicatorHost& host)
    : config_(config), scheduler_(scheduler), host_(host) {}

int parse_poll_interval(const std::string& raw) {
    long long v = 0;
    if (parse_int_strict(raw, &v)) {
        return clamp_poll_interval(v);
    }

    // Whole numbers past the long long range still clamp.
    const std::string t = trim(raw);
    const size_t digits = (!t.empty() && (t[0] == '+' || t[0] == '-')) ? 1 : 0;
    if (t.size() > digits && t.find_first_not_of("0123456789", digits) == std::string::npos) {
        return clamp_poll_interval(t[0] == '-' ? LLONG_MIN : LLONG_MAX);
    }
    return kDefaultPollIntervalSeconds;
}

void SettingsController::apply(const std::string& new_credential, const std::string& new_interval_raw) {
    config_.set_credential(new_credential);
    config_.set_poll_interval(parse_poll_interval(new_interval_raw));

    if (!config_.save()) {
        app_log("settings: failed to save %s, keeping changes in memory", config_.path().c_str());
    }

    app_log("settings: token %s, interval %ds",
            config_.has_credential() ? "set" : "unset", config_.poll_interval());

    scheduler_.reconfigure(config_.poll_interval());
    scheduler_.refresh_now();
}

bool SettingsController::edit() {
    std::optional<SettingsInput> input = host_.show_settings_dialog(config_.credential(), config_.poll_interval());
    if (!input.has_value()) {
        return false;
    }

    apply(input->credential, input->interval_text);
    return true;
}
