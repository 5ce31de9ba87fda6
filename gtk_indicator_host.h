#ifndef GTK_INDICATOR_HOST_H
#define GTK_INDICATOR_HOST_H

#include "indicator_host.h"

#include <functional>
#include <map>
#include <memory>
#include <vector>

#include <gtk/gtk.h>
#include <libayatana-appindicator/app-indicator.h>

// IndicatorHost rendered with an Ayatana AppIndicator and a GTK menu.
// Requires gtk_init() and notify_init() before construction.
class GtkIndicatorHost : public IndicatorHost {
public:
    GtkIndicatorHost();
    ~GtkIndicatorHost() override;

    GtkIndicatorHost(const GtkIndicatorHost&) = delete;
    GtkIndicatorHost& operator=(const GtkIndicatorHost&) = delete;

    // Build the menu from a layout; on_activate fires for activatable items.
    void build_menu(const std::vector<MenuItemDescriptor>& layout,
                    std::function<void(MenuItemId)> on_activate);

    void set_title(const std::string& title) override;
    void set_item_text(MenuItemId id, const std::string& text) override;
    std::optional<SettingsInput> show_settings_dialog(const std::string& credential,
                                                      int poll_interval_s) override;
    void show_about_dialog() override;
    void notify(const std::string& summary, const std::string& body) override;
    void start_timer(int period_s, std::function<void()> on_tick) override;
    void stop_timer() override;

private:
    struct ItemBinding {
        GtkIndicatorHost* host;
        MenuItemId id;
    };

    static void on_item_activate(GtkMenuItem* item, gpointer user_data);
    static gboolean on_timer(gpointer user_data);

    AppIndicator* indicator_ = nullptr;
    GtkWidget* menu_ = nullptr;
    std::map<MenuItemId, GtkWidget*> items_;
    std::vector<std::unique_ptr<ItemBinding>> bindings_;
    std::function<void(MenuItemId)> on_activate_;

    guint timer_id_ = 0;
    std::function<void()> on_tick_;
};

#endif // GTK_INDICATOR_HOST_H
