#include "refresh_scheduler.h"

#include <pthread.h>

// Structure for passing data between threads
struct RefreshScheduler::FetchJob {
    RefreshScheduler* scheduler = nullptr;
    std::shared_ptr<bool> alive;
    std::shared_ptr<UsageClientInterface> client;
    std::string credential;
    FetchResult result;
};

RefreshScheduler::RefreshScheduler(ConfigStore& config,
                                   std::shared_ptr<UsageClientInterface> client,
                                   IndicatorHost& host,
                                   Clock clock)
    : config_(config),
      client_(std::move(client)),
      host_(host),
      clock_(std::move(clock)),
      alive_(std::make_shared<bool>(true)),
      period_s_(config.poll_interval()) {
    if (!clock_) {
        clock_ = []() { return time(nullptr); };
    }
}

RefreshScheduler::~RefreshScheduler() {
    stop();
    *alive_ = false;
}

void RefreshScheduler::start() {
    apply(config_.has_credential() ? make_pending_state() : make_credential_missing_state());
    reconfigure(config_.poll_interval());
    if (config_.has_credential()) {
        start_fetch();
    }
}

void RefreshScheduler::stop() {
    if (timer_running_) {
        host_.stop_timer();
        timer_running_ = false;
    }
}

bool RefreshScheduler::refresh_now() {
    return trigger();
}

void RefreshScheduler::reconfigure(int period_s) {
    period_s_ = clamp_poll_interval(period_s);

    // Remove old timer before creating the new one.
    stop();
    host_.start_timer(period_s_, [this]() { on_tick(); });
    timer_running_ = true;

    next_refresh_at_ = clock_() + period_s_;
    app_log("timer: period %ds", period_s_);
}

bool RefreshScheduler::is_fetching() const {
    std::lock_guard<std::mutex> lock(mu_);
    return fetching_;
}

void RefreshScheduler::on_tick() {
    next_refresh_at_ = clock_() + period_s_;
    trigger();
}

bool RefreshScheduler::trigger() {
    if (!config_.has_credential()) {
        apply(make_credential_missing_state());
        return false;
    }
    return start_fetch();
}

bool RefreshScheduler::start_fetch() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (fetching_) {
            return false;
        }
        fetching_ = true;
    }

    FetchJob* job = new FetchJob();
    job->scheduler = this;
    job->alive = alive_;
    job->client = client_;
    job->credential = config_.credential();

    host_.set_title(kGlyphRefreshing);

    pthread_t thread;
    if (pthread_create(&thread, nullptr, fetch_thread, job) == 0) {
        pthread_detach(thread);
        // Thread will call g_idle_add when done
        return true;
    }

    delete job;
    app_log("fetch: pthread_create failed");
    complete_fetch(make_failure(FailureKind::Unknown, 0, "Could not start fetch"));
    return false;
}

void* RefreshScheduler::fetch_thread(void* arg) {
    FetchJob* job = (FetchJob*)arg;

    try {
        job->result = job->client->fetch(job->credential);
    } catch (const std::exception& e) {
        job->result = make_failure(FailureKind::Unknown, 0, truncate_message(e.what(), kStatusMessageMaxLen));
    }

    // Schedule callback on main thread
    g_idle_add(on_fetch_complete, job);
    return nullptr;
}

gboolean RefreshScheduler::on_fetch_complete(gpointer user_data) {
    std::unique_ptr<FetchJob> job((FetchJob*)user_data);
    if (*job->alive) {
        job->scheduler->complete_fetch(job->result);
    }
    return G_SOURCE_REMOVE;
}

void RefreshScheduler::complete_fetch(const FetchResult& result) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        fetching_ = false;
    }
    apply(reduce_display_state(result, period_s_, clock_()));
}

void RefreshScheduler::apply(const DisplayState& state) {
    const bool newly_expired = state.kind == DisplayKind::Unauthorized &&
                               state_.kind != DisplayKind::Unauthorized;

    state_ = state;
    apply_display_state(host_, state_);

    if (newly_expired) {
        host_.notify("OAuth token expired", "Open Settings to enter a new token.");
    }
}
