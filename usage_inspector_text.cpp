// =============================================================================
// usage_inspector_text.cpp - One-shot terminal version of Usage Inspector
// =============================================================================
// No GUI dependencies: fetches once and prints what the indicator would show.
// =============================================================================

#include "config_store.h"
#include "display_state.h"
#include "usage_client.h"

#include <iostream>

static void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] [TOKEN]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --config <path>  Settings file (default: " << default_config_path() << ")" << std::endl;
    std::cerr << "  --help           Show this help message" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Token:" << std::endl;
    std::cerr << "  Passed as argument, USAGE_INSPECTOR_TOKEN environment variable," << std::endl;
    std::cerr << "  or the oauth_token stored in the settings file." << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_path = default_config_path();
    std::string token;

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
                return 2;
            }
        } else if (arg[0] != '-') {
            token = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    ConfigStore config(config_path);
    config.load();

    if (token.empty()) {
        const char* env_token = std::getenv("USAGE_INSPECTOR_TOKEN");
        if (env_token) {
            token = env_token;
        }
    }
    if (!token.empty()) {
        config.set_credential(token);
    }

    if (!config.has_credential()) {
        DisplayState missing = make_credential_missing_state();
        std::cout << missing.title << " " << missing.status_line() << std::endl;
        return 1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    CurlUsageClient client;
    FetchResult result = client.fetch(config.credential());
    DisplayState state = reduce_display_state(result, config.poll_interval(), time(nullptr));

    std::cout << state.title << std::endl << std::endl;

    // Same grouping as the indicator menu, action items left out.
    bool need_blank = false;
    for (const MenuItemDescriptor& d : default_menu_layout()) {
        if (d.id == MenuItemId::Separator) {
            need_blank = true;
            continue;
        }
        const std::string text = state.item_text(d.id);
        if (text.empty()) {
            continue;
        }
        if (need_blank) {
            std::cout << std::endl;
            need_blank = false;
        }
        std::cout << text << std::endl;
    }

    curl_global_cleanup();

    return result.success ? 0 : 1;
}
