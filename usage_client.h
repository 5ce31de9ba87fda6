#ifndef USAGE_CLIENT_H
#define USAGE_CLIENT_H

#include "usage_common.h"

#include <string>

static constexpr const char* kMessagesUrl = "https://api.anthropic.com/v1/messages";
static constexpr const char* kProbeModel = "claude-haiku-4-5-20251001";
static constexpr const char* kApiVersion = "2023-06-01";
static constexpr const char* kApiBeta = "oauth-2025-04-20";

static constexpr const char* kHeaderSessionUtilization = "anthropic-ratelimit-unified-5h-utilization";
static constexpr const char* kHeaderWeeklyUtilization = "anthropic-ratelimit-unified-7d-utilization";
static constexpr const char* kHeaderSessionReset = "anthropic-ratelimit-unified-5h-reset";
static constexpr const char* kHeaderWeeklyReset = "anthropic-ratelimit-unified-7d-reset";
static constexpr const char* kHeaderStatus = "anthropic-ratelimit-unified-status";

// Performs one usage probe. Implementations never throw; every failure is
// returned as a FetchFailure. fetch() runs on a worker thread.
class UsageClientInterface {
public:
    virtual ~UsageClientInterface() = default;
    virtual FetchResult fetch(const std::string& credential) = 0;
};

class CurlUsageClient : public UsageClientInterface {
public:
    explicit CurlUsageClient(std::string url = kMessagesUrl);

    FetchResult fetch(const std::string& credential) override;

private:
    std::string url_;
};

// POST the probe payload; response body is discarded, headers are kept.
RequestResult make_request(const std::string& url, const std::string& credential);

// JSON body of the probe request (max_tokens = 1).
std::string build_probe_body();

// Parse rate-limit headers. Throws std::invalid_argument / std::out_of_range
// on a malformed utilization value.
UsageSnapshot parse_usage_headers(const HeaderMap& headers, time_t fetched_at);

// Map a completed request to a snapshot or a classified failure.
FetchResult classify_response(const RequestResult& r, time_t fetched_at);

#endif // USAGE_CLIENT_H
