#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include "indicator_host.h"
#include "usage_client.h"

#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Scripted UsageClient. hold() makes later fetches block until release(),
// which keeps a fetch in flight for as long as a test needs.
class FakeUsageClient : public UsageClientInterface {
public:
    FetchResult fetch(const std::string& credential) override;

    void set_result(const FetchResult& result);
    void hold();
    void release();

    int call_count() const;
    int finished_count() const;
    std::string last_credential() const;

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool held_ = false;
    int calls_ = 0;
    int finished_ = 0;
    FetchResult next_ = make_success(UsageSnapshot{});
    std::string last_credential_;
};

// Records every host call.
class FakeIndicatorHost : public IndicatorHost {
public:
    void set_title(const std::string& t) override;
    void set_item_text(MenuItemId id, const std::string& text) override;
    std::optional<SettingsInput> show_settings_dialog(const std::string& credential,
                                                      int poll_interval_s) override;
    void show_about_dialog() override;
    void notify(const std::string& summary, const std::string& body) override;
    void start_timer(int period_s, std::function<void()> on_tick) override;
    void stop_timer() override;

    // Simulate the periodic timer firing.
    void fire_timer();

    std::string title;
    std::vector<std::string> titles;
    std::map<MenuItemId, std::string> items;

    bool timer_active = false;
    int timer_period = 0;
    int timer_starts = 0;
    int timer_stops = 0;
    std::function<void()> on_tick;

    std::optional<SettingsInput> dialog_response;
    int dialog_calls = 0;
    std::string dialog_credential;
    int dialog_interval = 0;

    int about_calls = 0;
    std::vector<std::string> notifications;
};

UsageSnapshot make_snapshot(double session, double weekly,
                            std::optional<int64_t> session_reset,
                            std::optional<int64_t> weekly_reset,
                            const std::string& status);

// Iterate the default GLib main context until done() or the timeout.
bool pump_main_loop_until(const std::function<bool()>& done, int timeout_ms = 3000);

// Iterate the default GLib main context for a fixed time.
void pump_main_loop_for(int ms);

#endif // TEST_SUPPORT_H
