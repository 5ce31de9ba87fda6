#ifndef REFRESH_SCHEDULER_H
#define REFRESH_SCHEDULER_H

#include "config_store.h"
#include "display_state.h"
#include "indicator_host.h"
#include "usage_client.h"

#include <functional>
#include <memory>
#include <mutex>

#include <glib.h>

// Owns the periodic timer and the single in-flight fetch.
//
// States: Idle, Fetching, and Disabled (no credential configured). Triggers
// arriving while a fetch is in flight are dropped. The fetch itself runs on a
// detached worker thread; its result is handed back to the GLib main loop
// with g_idle_add and reduced there, so every IndicatorHost call happens on
// the UI thread.
class RefreshScheduler {
public:
    using Clock = std::function<time_t()>;

    RefreshScheduler(ConfigStore& config,
                     std::shared_ptr<UsageClientInterface> client,
                     IndicatorHost& host,
                     Clock clock = Clock());
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    // Apply the startup placeholder, start the timer and kick off the first
    // fetch when a credential is configured.
    void start();
    void stop();

    // Manual "refresh now". Returns true if a fetch was started.
    bool refresh_now();

    // Restart the timer with a new period; takes effect immediately.
    void reconfigure(int period_s);

    bool is_fetching() const;
    int period() const { return period_s_; }
    time_t next_refresh_at() const { return next_refresh_at_; }
    const DisplayState& display_state() const { return state_; }

private:
    struct FetchJob;

    void on_tick();
    bool trigger();
    bool start_fetch();
    void complete_fetch(const FetchResult& result);
    void apply(const DisplayState& state);

    static void* fetch_thread(void* arg);
    static gboolean on_fetch_complete(gpointer user_data);

    ConfigStore& config_;
    std::shared_ptr<UsageClientInterface> client_;
    IndicatorHost& host_;
    Clock clock_;

    // Cleared in the destructor so late completions are dropped.
    std::shared_ptr<bool> alive_;

    mutable std::mutex mu_;
    bool fetching_ = false;

    bool timer_running_ = false;
    int period_s_;
    time_t next_refresh_at_ = 0;
    DisplayState state_;
};

#endif // REFRESH_SCHEDULER_H
