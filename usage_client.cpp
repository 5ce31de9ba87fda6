#include "usage_client.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

// ============================================================================
// Request
// ============================================================================

std::string build_probe_body() {
    json body = {
        {"model", kProbeModel},
        {"max_tokens", 1},
        {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})},
    };
    return body.dump();
}

RequestResult make_request(const std::string& url, const std::string& credential) {
    RequestResult out;

    CURL* curl = curl_easy_init();
    if (!curl) {
        out.curl_code = CURLE_FAILED_INIT;
        out.curl_error = "curl_easy_init failed";
        return out;
    }

    std::string response;
    const std::string body = build_probe_body();
    const std::string auth_header = "Authorization: Bearer " + credential;
    const std::string version_header = std::string("anthropic-version: ") + kApiVersion;
    const std::string beta_header = std::string("anthropic-beta: ") + kApiBeta;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, auth_header.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, version_header.c_str());
    headers = curl_slist_append(headers, beta_header.c_str());
    headers = curl_slist_append(headers, "Cache-Control: no-cache");
    headers = curl_slist_append(headers, "Pragma: no-cache");

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &out.headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, kRequestTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    out.curl_code = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    out.http_code = http_code;
    if (errbuf[0] != '\0') {
        out.curl_error = errbuf;
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    return out;
}

// ============================================================================
// Parsing
// ============================================================================

static const std::string* find_header(const HeaderMap& headers, const char* name) {
    auto it = headers.find(name);
    if (it == headers.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

static double parse_utilization(const HeaderMap& headers, const char* name) {
    const std::string* value = find_header(headers, name);
    if (!value) {
        return 0.0;
    }

    const std::string message = "could not convert string to float: '" + *value + "'";
    size_t idx = 0;
    double v = 0.0;
    try {
        v = std::stod(*value, &idx);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument(message);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(message);
    }
    if (idx != value->size()) {
        throw std::invalid_argument(message);
    }

    if (std::isnan(v)) {
        return 0.0;
    }
    return std::min(1.0, std::max(0.0, v));
}

static std::optional<int64_t> parse_reset_epoch(const HeaderMap& headers, const char* name) {
    const std::string* value = find_header(headers, name);
    if (!value) {
        return std::nullopt;
    }

    long long epoch = 0;
    if (!parse_int_strict(*value, &epoch)) {
        return std::nullopt;
    }
    return (int64_t)epoch;
}

UsageSnapshot parse_usage_headers(const HeaderMap& headers, time_t fetched_at) {
    UsageSnapshot s;
    s.session_utilization = parse_utilization(headers, kHeaderSessionUtilization);
    s.weekly_utilization = parse_utilization(headers, kHeaderWeeklyUtilization);
    s.session_reset_epoch = parse_reset_epoch(headers, kHeaderSessionReset);
    s.weekly_reset_epoch = parse_reset_epoch(headers, kHeaderWeeklyReset);

    const std::string* status = find_header(headers, kHeaderStatus);
    s.status_label = status ? *status : "unknown";
    s.fetched_at = fetched_at;
    return s;
}

FetchResult classify_response(const RequestResult& r, time_t fetched_at) {
    if (r.curl_code != CURLE_OK) {
        std::string message = curl_easy_strerror(r.curl_code);
        if (!r.curl_error.empty()) {
            message += " (" + r.curl_error + ")";
        }
        return make_failure(FailureKind::NetworkError, 0, message);
    }

    if (r.http_code == 401) {
        return make_failure(FailureKind::Unauthorized, r.http_code, "Unauthorized");
    }

    if (!is_http_success(r.http_code)) {
        return make_failure(FailureKind::HttpError, r.http_code,
                            "HTTP error: " + std::to_string(r.http_code));
    }

    try {
        return make_success(parse_usage_headers(r.headers, fetched_at));
    } catch (const std::exception& e) {
        return make_failure(FailureKind::Unknown, r.http_code,
                            truncate_message(e.what(), kStatusMessageMaxLen));
    }
}

// ============================================================================
// CurlUsageClient
// ============================================================================

CurlUsageClient::CurlUsageClient(std::string url) : url_(std::move(url)) {}

FetchResult CurlUsageClient::fetch(const std::string& credential) {
    if (credential.empty()) {
        return make_failure(FailureKind::Unknown, 0, "Token not set");
    }

    RequestResult r = make_request(url_, credential);
    FetchResult result = classify_response(r, time(nullptr));

    if (result.success) {
        app_log("fetch ok: session=%.3f weekly=%.3f status=%s",
                result.snapshot.session_utilization,
                result.snapshot.weekly_utilization,
                result.snapshot.status_label.c_str());
    } else {
        app_log("fetch failed: http=%ld curl=%d %s",
                r.http_code, (int)r.curl_code, result.failure.message.c_str());
    }
    return result;
}
