#ifndef DISPLAY_STATE_H
#define DISPLAY_STATE_H

#include "usage_common.h"

#include <string>
#include <vector>

// ============================================================================
// Menu Layout
// ============================================================================

// Stable identifiers for the indicator menu. Order of declaration is not the
// display order; see default_menu_layout().
enum class MenuItemId {
    Session,
    SessionReset,
    Weekly,
    WeeklyReset,
    Status,
    LastUpdate,
    NextUpdate,
    RefreshNow,
    Settings,
    About,
    Quit,
    Separator,
};

struct MenuItemDescriptor {
    MenuItemId id;
    std::string label;
    bool activatable;
};

std::vector<MenuItemDescriptor> default_menu_layout();

// ============================================================================
// Display State
// ============================================================================

enum class DisplayKind {
    Pending,
    CredentialMissing,
    Usage,
    Unauthorized,
    Failure,
};

// Everything the indicator shows. Always replaced as a whole.
struct DisplayState {
    DisplayKind kind = DisplayKind::Pending;
    std::string title;
    std::string session_text;
    std::string session_reset_text;
    std::string weekly_text;
    std::string weekly_reset_text;
    std::string status_text;  // e.g. "allowed", "Token expired"
    std::string last_update_text;
    std::string next_update_text;
    time_t next_refresh_at = 0;

    // "Status: <status_text>"
    std::string status_line() const;

    // Menu text for a data item; empty for action items and separators.
    std::string item_text(MenuItemId id) const;

    bool operator==(const DisplayState& other) const;
    bool operator!=(const DisplayState& other) const { return !(*this == other); }
};

// Traffic-light glyph for a utilization ratio.
const char* usage_icon(double ratio);

// floor(ratio * 100)
int usage_percent(double ratio);

// "unknown", "just reset", "03:15 PM (1h 30m)" or "03:15 PM (10m)"
std::string format_reset(const std::optional<int64_t>& reset_epoch, time_t now);

DisplayState reduce_display_state(const FetchResult& result, int poll_interval_s, time_t now);
DisplayState make_credential_missing_state();
DisplayState make_pending_state();

#endif // DISPLAY_STATE_H
