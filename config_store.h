#ifndef CONFIG_STORE_H
#define CONFIG_STORE_H

#include "usage_common.h"

#include <string>

// Persisted settings: {"oauth_token": "...", "refresh_interval": 300}.
// Keys it does not recognise are kept as-is and written back on save.
class ConfigStore {
public:
    explicit ConfigStore(std::string path);

    // Missing or unreadable/corrupt file leaves the defaults in place and
    // returns false. Never throws.
    bool load();

    // Atomic write (tmp + rename), mode 0600.
    bool save() const;

    const std::string& path() const { return path_; }

    const std::string& credential() const { return credential_; }
    bool has_credential() const { return !credential_.empty(); }
    void set_credential(const std::string& credential);

    int poll_interval() const { return poll_interval_s_; }
    void set_poll_interval(int seconds);

private:
    std::string path_;
    std::string credential_;
    int poll_interval_s_ = kDefaultPollIntervalSeconds;
    json extra_ = json::object();
};

// Clamp to the minimum poll interval.
int clamp_poll_interval(long long seconds);

// $XDG_CONFIG_HOME/usage-inspector/config.json, else ~/.config/usage-inspector/config.json
std::string default_config_path();

#endif // CONFIG_STORE_H
