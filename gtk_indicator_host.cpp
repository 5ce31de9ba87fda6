#include "gtk_indicator_host.h"

#include <libnotify/notify.h>

static constexpr const char* kIndicatorIcon = "utilities-system-monitor";

GtkIndicatorHost::GtkIndicatorHost() {
    indicator_ = app_indicator_new(kAppId, kIndicatorIcon, APP_INDICATOR_CATEGORY_APPLICATION_STATUS);
    app_indicator_set_status(indicator_, APP_INDICATOR_STATUS_ACTIVE);
    app_indicator_set_title(indicator_, kAppName);
    app_indicator_set_label(indicator_, kGlyphPending, "");
}

GtkIndicatorHost::~GtkIndicatorHost() {
    stop_timer();
    if (indicator_) {
        g_object_unref(indicator_);
    }
}

// ============================================================================
// Menu
// ============================================================================

void GtkIndicatorHost::build_menu(const std::vector<MenuItemDescriptor>& layout,
                                  std::function<void(MenuItemId)> on_activate) {
    on_activate_ = std::move(on_activate);

    GtkWidget* menu = gtk_menu_new();

    for (const MenuItemDescriptor& d : layout) {
        if (d.id == MenuItemId::Separator) {
            gtk_menu_shell_append(GTK_MENU_SHELL(menu), gtk_separator_menu_item_new());
            continue;
        }

        GtkWidget* item = gtk_menu_item_new_with_label(d.label.c_str());
        if (d.activatable) {
            bindings_.push_back(std::unique_ptr<ItemBinding>(new ItemBinding{this, d.id}));
            g_signal_connect(item, "activate", G_CALLBACK(on_item_activate), bindings_.back().get());
        } else {
            // Informational rows only.
            gtk_widget_set_sensitive(item, FALSE);
        }
        gtk_menu_shell_append(GTK_MENU_SHELL(menu), item);
        items_[d.id] = item;
    }

    gtk_widget_show_all(menu);
    app_indicator_set_menu(indicator_, GTK_MENU(menu));
    menu_ = menu;
}

void GtkIndicatorHost::on_item_activate(GtkMenuItem* item, gpointer user_data) {
    (void)item;
    ItemBinding* binding = (ItemBinding*)user_data;
    if (binding->host->on_activate_) {
        binding->host->on_activate_(binding->id);
    }
}

void GtkIndicatorHost::set_title(const std::string& title) {
    app_indicator_set_label(indicator_, title.c_str(), "");
    app_indicator_set_title(indicator_, (std::string(kAppName) + ": " + title).c_str());
}

void GtkIndicatorHost::set_item_text(MenuItemId id, const std::string& text) {
    auto it = items_.find(id);
    if (it == items_.end()) {
        return;
    }
    gtk_menu_item_set_label(GTK_MENU_ITEM(it->second), text.c_str());
}

// ============================================================================
// Dialogs
// ============================================================================

std::optional<SettingsInput> GtkIndicatorHost::show_settings_dialog(const std::string& credential,
                                                                    int poll_interval_s) {
    GtkWidget* dialog = gtk_dialog_new_with_buttons(
        "Usage Inspector Settings",
        nullptr,
        (GtkDialogFlags)(GTK_DIALOG_MODAL | GTK_DIALOG_DESTROY_WITH_PARENT),
        "Cancel",
        GTK_RESPONSE_CANCEL,
        "Save",
        GTK_RESPONSE_OK,
        nullptr
    );
    gtk_dialog_set_default_response(GTK_DIALOG(dialog), GTK_RESPONSE_OK);

    GtkWidget* content = gtk_dialog_get_content_area(GTK_DIALOG(dialog));
    GtkWidget* vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_container_set_border_width(GTK_CONTAINER(vbox), 10);
    gtk_container_add(GTK_CONTAINER(content), vbox);

    GtkWidget* token_label = gtk_label_new("OAuth token (starts with sk-ant-oat01-...):");
    gtk_label_set_xalign(GTK_LABEL(token_label), 0.0);
    gtk_box_pack_start(GTK_BOX(vbox), token_label, FALSE, FALSE, 0);

    GtkWidget* token_entry = gtk_entry_new();
    gtk_entry_set_visibility(GTK_ENTRY(token_entry), FALSE);
    gtk_entry_set_invisible_char(GTK_ENTRY(token_entry), '*');
    gtk_entry_set_width_chars(GTK_ENTRY(token_entry), 48);
    gtk_entry_set_text(GTK_ENTRY(token_entry), credential.c_str());
    gtk_entry_set_activates_default(GTK_ENTRY(token_entry), TRUE);
    gtk_box_pack_start(GTK_BOX(vbox), token_entry, FALSE, FALSE, 0);

    GtkWidget* interval_label = gtk_label_new("Refresh interval (seconds, minimum 10):");
    gtk_label_set_xalign(GTK_LABEL(interval_label), 0.0);
    gtk_box_pack_start(GTK_BOX(vbox), interval_label, FALSE, FALSE, 0);

    GtkWidget* interval_entry = gtk_entry_new();
    gtk_entry_set_text(GTK_ENTRY(interval_entry), std::to_string(poll_interval_s).c_str());
    gtk_entry_set_activates_default(GTK_ENTRY(interval_entry), TRUE);
    gtk_box_pack_start(GTK_BOX(vbox), interval_entry, FALSE, FALSE, 0);

    gtk_widget_show_all(dialog);

    std::optional<SettingsInput> out;
    const int resp = gtk_dialog_run(GTK_DIALOG(dialog));
    if (resp == GTK_RESPONSE_OK) {
        const char* token_text = gtk_entry_get_text(GTK_ENTRY(token_entry));
        const char* interval_text = gtk_entry_get_text(GTK_ENTRY(interval_entry));
        SettingsInput input;
        input.credential = token_text ? token_text : "";
        input.interval_text = interval_text ? interval_text : "";
        out = input;
    }

    gtk_widget_destroy(dialog);
    return out;
}

void GtkIndicatorHost::show_about_dialog() {
    GtkWidget* dialog = gtk_message_dialog_new(
        nullptr,
        GTK_DIALOG_MODAL,
        GTK_MESSAGE_INFO,
        GTK_BUTTONS_OK,
        "%s", kAppName
    );
    gtk_message_dialog_format_secondary_text(
        GTK_MESSAGE_DIALOG(dialog),
        "Shows session (5h) and weekly (7d) rate-limit usage in the panel.\n\n"
        "🟢 below 50%%   🟡 50-79%%   🔴 80%% and above"
    );
    gtk_dialog_run(GTK_DIALOG(dialog));
    gtk_widget_destroy(dialog);
}

void GtkIndicatorHost::notify(const std::string& summary, const std::string& body) {
    NotifyNotification* notification = notify_notification_new(
        summary.c_str(),
        body.c_str(),
        "dialog-warning"
    );
    notify_notification_set_urgency(notification, NOTIFY_URGENCY_NORMAL);
    notify_notification_set_timeout(notification, 10000);  // 10 seconds

    GError* error = nullptr;
    if (!notify_notification_show(notification, &error)) {
        app_log("notify: %s", error ? error->message : "unknown error");
        if (error) {
            g_error_free(error);
        }
    }
    g_object_unref(notification);
}

// ============================================================================
// Timer
// ============================================================================

void GtkIndicatorHost::start_timer(int period_s, std::function<void()> on_tick) {
    stop_timer();
    on_tick_ = std::move(on_tick);
    timer_id_ = g_timeout_add_seconds((guint)period_s, on_timer, this);
}

void GtkIndicatorHost::stop_timer() {
    if (timer_id_ > 0) {
        g_source_remove(timer_id_);
        timer_id_ = 0;
    }
}

gboolean GtkIndicatorHost::on_timer(gpointer user_data) {
    GtkIndicatorHost* host = (GtkIndicatorHost*)user_data;
    // The callback may restart the timer, which replaces on_tick_.
    std::function<void()> tick = host->on_tick_;
    if (tick) {
        tick();
    }
    return G_SOURCE_CONTINUE;
}
