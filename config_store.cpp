#include "config_store.h"

#include <cstdio>
#include <fstream>
#include <sys/stat.h>
#include <glib.h>

ConfigStore::ConfigStore(std::string path) : path_(std::move(path)) {}

bool ConfigStore::load() {
    credential_.clear();
    poll_interval_s_ = kDefaultPollIntervalSeconds;
    extra_ = json::object();

    std::ifstream in(path_);
    if (!in.is_open()) {
        app_log("config: %s not found, using defaults", path_.c_str());
        return false;
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const std::exception& e) {
        app_log("config: failed to parse %s (%s), using defaults", path_.c_str(), e.what());
        return false;
    }

    if (!j.is_object()) {
        app_log("config: %s is not a JSON object, using defaults", path_.c_str());
        return false;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "oauth_token") {
            if (it.value().is_string()) {
                credential_ = trim(it.value().get<std::string>());
            }
        } else if (it.key() == "refresh_interval") {
            if (it.value().is_number_integer()) {
                poll_interval_s_ = clamp_poll_interval(it.value().get<long long>());
            }
        } else {
            extra_[it.key()] = it.value();
        }
    }

    app_log("config: loaded %s (token %s, interval %ds)",
            path_.c_str(), credential_.empty() ? "unset" : "set", poll_interval_s_);
    return true;
}

bool ConfigStore::save() const {
    gchar* dir = g_path_get_dirname(path_.c_str());
    g_mkdir_with_parents(dir, 0700);
    g_free(dir);

    json j = extra_;
    j["oauth_token"] = credential_;
    j["refresh_interval"] = poll_interval_s_;

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            app_log("config: cannot open %s for writing", tmp.c_str());
            return false;
        }
        out << j.dump(2) << "\n";
        if (!out.good()) {
            app_log("config: write to %s failed", tmp.c_str());
            return false;
        }
    }

    (void)chmod(tmp.c_str(), 0600);

    if (rename(tmp.c_str(), path_.c_str()) != 0) {
        app_log("config: rename to %s failed", path_.c_str());
        (void)remove(tmp.c_str());
        return false;
    }

    return true;
}

void ConfigStore::set_credential(const std::string& credential) {
    credential_ = trim(credential);
}

void ConfigStore::set_poll_interval(int seconds) {
    poll_interval_s_ = clamp_poll_interval(seconds);
}

int clamp_poll_interval(long long seconds) {
    if (seconds < kMinPollIntervalSeconds) {
        return kMinPollIntervalSeconds;
    }
    // Keep the value within what g_timeout_add_seconds accepts.
    if (seconds > 24LL * 60 * 60) {
        return 24 * 60 * 60;
    }
    return (int)seconds;
}

std::string default_config_path() {
    const char* xdg = getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/usage-inspector/config.json";
    }

    const char* home = get_home_dir_fallback();
    if (home && *home) {
        return std::string(home) + "/.config/usage-inspector/config.json";
    }
    return "/tmp/usage-inspector-config.json";
}
