#ifndef INDICATOR_HOST_H
#define INDICATOR_HOST_H

#include "display_state.h"

#include <functional>
#include <optional>
#include <string>

struct SettingsInput {
    std::string credential;
    std::string interval_text;
};

// Status-indicator host. All calls are made on the UI thread.
class IndicatorHost {
public:
    virtual ~IndicatorHost() = default;

    virtual void set_title(const std::string& title) = 0;
    virtual void set_item_text(MenuItemId id, const std::string& text) = 0;

    // Modal. Returns std::nullopt on cancel.
    virtual std::optional<SettingsInput> show_settings_dialog(const std::string& credential,
                                                              int poll_interval_s) = 0;
    virtual void show_about_dialog() = 0;
    virtual void notify(const std::string& summary, const std::string& body) = 0;

    // Replaces any running timer.
    virtual void start_timer(int period_s, std::function<void()> on_tick) = 0;
    virtual void stop_timer() = 0;
};

// Push a full DisplayState to the host: title plus every data item.
void apply_display_state(IndicatorHost& host, const DisplayState& state);

#endif // INDICATOR_HOST_H
