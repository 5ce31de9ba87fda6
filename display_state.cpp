#include "display_state.h"

#include <cmath>

static constexpr const char* kPlaceholder = "--";

// ============================================================================
// Menu Layout
// ============================================================================

std::vector<MenuItemDescriptor> default_menu_layout() {
    return {
        {MenuItemId::Session, "Session (5h): --", false},
        {MenuItemId::SessionReset, "  Resets: --", false},
        {MenuItemId::Separator, "", false},
        {MenuItemId::Weekly, "Weekly (7d): --", false},
        {MenuItemId::WeeklyReset, "  Resets: --", false},
        {MenuItemId::Separator, "", false},
        {MenuItemId::Status, "Status: --", false},
        {MenuItemId::LastUpdate, "Last update: --", false},
        {MenuItemId::NextUpdate, "Next update: --", false},
        {MenuItemId::Separator, "", false},
        {MenuItemId::RefreshNow, "Refresh Now", true},
        {MenuItemId::Settings, "Settings...", true},
        {MenuItemId::About, "About", true},
        {MenuItemId::Separator, "", false},
        {MenuItemId::Quit, "Quit", true},
    };
}

// ============================================================================
// DisplayState
// ============================================================================

std::string DisplayState::status_line() const {
    return "Status: " + status_text;
}

std::string DisplayState::item_text(MenuItemId id) const {
    switch (id) {
        case MenuItemId::Session:
            return session_text;
        case MenuItemId::SessionReset:
            return session_reset_text;
        case MenuItemId::Weekly:
            return weekly_text;
        case MenuItemId::WeeklyReset:
            return weekly_reset_text;
        case MenuItemId::Status:
            return status_line();
        case MenuItemId::LastUpdate:
            return last_update_text;
        case MenuItemId::NextUpdate:
            return next_update_text;
        default:
            return "";
    }
}

bool DisplayState::operator==(const DisplayState& other) const {
    return kind == other.kind &&
           title == other.title &&
           session_text == other.session_text &&
           session_reset_text == other.session_reset_text &&
           weekly_text == other.weekly_text &&
           weekly_reset_text == other.weekly_reset_text &&
           status_text == other.status_text &&
           last_update_text == other.last_update_text &&
           next_update_text == other.next_update_text &&
           next_refresh_at == other.next_refresh_at;
}

// ============================================================================
// Formatting
// ============================================================================

const char* usage_icon(double ratio) {
    if (ratio >= 0.80) {
        return kGlyphRed;
    }
    if (ratio >= 0.50) {
        return kGlyphYellow;
    }
    return kGlyphGreen;
}

int usage_percent(double ratio) {
    return (int)std::floor(ratio * 100.0);
}

std::string format_reset(const std::optional<int64_t>& reset_epoch, time_t now) {
    if (!reset_epoch.has_value()) {
        return "unknown";
    }

    int64_t remaining = *reset_epoch - (int64_t)now;
    if (remaining < 0) {
        return "just reset";
    }

    return format_clock_12h((time_t)*reset_epoch) + " (" + format_duration_hm(remaining) + ")";
}

// ============================================================================
// Reducer
// ============================================================================

static DisplayState placeholder_state(DisplayKind kind, const char* title, const std::string& status) {
    DisplayState d;
    d.kind = kind;
    d.title = title;
    d.session_text = std::string("Session (5h): ") + kPlaceholder;
    d.session_reset_text = std::string("  Resets: ") + kPlaceholder;
    d.weekly_text = std::string("Weekly (7d): ") + kPlaceholder;
    d.weekly_reset_text = std::string("  Resets: ") + kPlaceholder;
    d.status_text = status;
    d.last_update_text = std::string("Last update: ") + kPlaceholder;
    d.next_update_text = std::string("Next update: ") + kPlaceholder;
    d.next_refresh_at = 0;
    return d;
}

static void stamp_update_times(DisplayState* d, int poll_interval_s, time_t now) {
    d->next_refresh_at = now + poll_interval_s;
    d->last_update_text = "Last update: " + format_clock_hms(now);
    d->next_update_text = "Next update: " + format_clock_hms(d->next_refresh_at);
}

DisplayState make_credential_missing_state() {
    return placeholder_state(DisplayKind::CredentialMissing, kGlyphWarning, "Token not set");
}

DisplayState make_pending_state() {
    return placeholder_state(DisplayKind::Pending, kGlyphPending, kPlaceholder);
}

DisplayState reduce_display_state(const FetchResult& result, int poll_interval_s, time_t now) {
    if (!result.success) {
        const FetchFailure& f = result.failure;
        DisplayState d;
        if (f.kind == FailureKind::Unauthorized) {
            d = placeholder_state(DisplayKind::Unauthorized, kGlyphKey, "Token expired");
        } else if (f.kind == FailureKind::HttpError) {
            d = placeholder_state(DisplayKind::Failure, kGlyphError, "Error " + std::to_string(f.http_code));
        } else {
            d = placeholder_state(DisplayKind::Failure, kGlyphError, truncate_message(f.message, kStatusMessageMaxLen));
        }
        stamp_update_times(&d, poll_interval_s, now);
        return d;
    }

    const UsageSnapshot& s = result.snapshot;
    const int session_pct = usage_percent(s.session_utilization);
    const int weekly_pct = usage_percent(s.weekly_utilization);

    DisplayState d;
    d.kind = DisplayKind::Usage;
    d.title = std::string(usage_icon(s.session_utilization)) + usage_icon(s.weekly_utilization) + " " +
              std::to_string(session_pct) + "/" + std::to_string(weekly_pct) + "%";
    d.session_text = "Session (5h): " + std::to_string(session_pct) + "%";
    d.session_reset_text = "  Resets: " + format_reset(s.session_reset_epoch, now);
    d.weekly_text = "Weekly (7d): " + std::to_string(weekly_pct) + "%";
    d.weekly_reset_text = "  Resets: " + format_reset(s.weekly_reset_epoch, now);
    d.status_text = s.status_label;
    stamp_update_times(&d, poll_interval_s, now);
    return d;
}
