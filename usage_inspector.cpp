// =============================================================================
// usage_inspector.cpp - Panel indicator for API rate-limit usage
// =============================================================================
// Shows session (5h) and weekly (7d) utilization as traffic-light glyphs in an
// Ayatana AppIndicator, polling on a configurable interval.
// =============================================================================

#include "config_store.h"
#include "gtk_indicator_host.h"
#include "refresh_scheduler.h"
#include "settings_controller.h"
#include "usage_client.h"

#include <iostream>

#include <libnotify/notify.h>

static void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --config <path>      Settings file (default: " << default_config_path() << ")" << std::endl;
    std::cerr << "  --refresh <seconds>  Refresh interval for this session (minimum "
              << kMinPollIntervalSeconds << ")" << std::endl;
    std::cerr << "  --help               Show this help message" << std::endl;
    std::cerr << std::endl;
    std::cerr << "The OAuth token and refresh interval are set from the indicator menu (Settings...)." << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_path = default_config_path();
    int refresh_override = 0;

    // Parse command-line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) {
                config_path = argv[++i];
            } else {
                std::cerr << "Error: --config requires a file path" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "--refresh" || arg == "-r") {
            long long v = 0;
            if (i + 1 < argc && parse_int_strict(argv[i + 1], &v)) {
                refresh_override = clamp_poll_interval(v);
                i++;
            } else {
                std::cerr << "Error: --refresh requires a number of seconds" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Initialize curl globally
    curl_global_init(CURL_GLOBAL_DEFAULT);

    // Initialize GTK
    if (!gtk_init_check(&argc, &argv)) {
        std::cerr << "Failed to initialize GTK. Is a display available?" << std::endl;
        curl_global_cleanup();
        return 1;
    }

    // Initialize libnotify
    notify_init(kAppName);

    ConfigStore config(config_path);
    config.load();
    if (refresh_override > 0) {
        config.set_poll_interval(refresh_override);
    }

    app_log("starting (config %s)", config.path().c_str());

    bool fetch_in_flight = false;
    {
        GtkIndicatorHost host;
        RefreshScheduler scheduler(config, std::make_shared<CurlUsageClient>(), host);
        SettingsController settings(config, scheduler, host);

        host.build_menu(default_menu_layout(), [&](MenuItemId id) {
            switch (id) {
                case MenuItemId::RefreshNow:
                    scheduler.refresh_now();
                    break;
                case MenuItemId::Settings:
                    settings.edit();
                    break;
                case MenuItemId::About:
                    host.show_about_dialog();
                    break;
                case MenuItemId::Quit:
                    gtk_main_quit();
                    break;
                default:
                    break;
            }
        });

        scheduler.start();

        // Run GTK main loop
        gtk_main();

        scheduler.stop();
        fetch_in_flight = scheduler.is_fetching();
    }

    app_log("exiting");

    // Cleanup
    notify_uninit();
    // A detached fetch may still be inside curl_easy_perform.
    if (fetch_in_flight) {
        app_log("exiting with a fetch in flight, skipping curl cleanup");
    } else {
        curl_global_cleanup();
    }

    return 0;
}
