#ifndef USAGE_COMMON_H
#define USAGE_COMMON_H

#include <string>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <map>
#include <optional>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// ============================================================================
// Constants
// ============================================================================

static constexpr const char* kAppName = "Usage Inspector";
static constexpr const char* kAppId = "usage-inspector";

static constexpr int kDefaultPollIntervalSeconds = 300;
static constexpr int kMinPollIntervalSeconds = 10;
static constexpr long kRequestTimeoutSeconds = 30;
static constexpr size_t kStatusMessageMaxLen = 30;

// Status indicator glyphs
static constexpr const char* kGlyphRed = "🔴";
static constexpr const char* kGlyphYellow = "🟡";
static constexpr const char* kGlyphGreen = "🟢";
static constexpr const char* kGlyphKey = "🔑";
static constexpr const char* kGlyphError = "❌";
static constexpr const char* kGlyphWarning = "⚠️";
static constexpr const char* kGlyphPending = "⏳";
static constexpr const char* kGlyphRefreshing = "🔄";

// ============================================================================
// Data Structures
// ============================================================================

// Header names are stored lower-cased.
using HeaderMap = std::map<std::string, std::string>;

// Structure to hold HTTP request results
struct RequestResult {
    CURLcode curl_code = CURLE_OK;
    long http_code = 0;
    HeaderMap headers;
    std::string curl_error;
};

// One fetch's parsed rate-limit metadata
struct UsageSnapshot {
    double session_utilization = 0.0;
    double weekly_utilization = 0.0;
    std::optional<int64_t> session_reset_epoch;
    std::optional<int64_t> weekly_reset_epoch;
    std::string status_label = "unknown";
    time_t fetched_at = 0;
};

enum class FailureKind {
    Unauthorized,
    HttpError,
    NetworkError,
    Unknown,
};

struct FetchFailure {
    FailureKind kind = FailureKind::Unknown;
    long http_code = 0;
    std::string message;
};

struct FetchResult {
    bool success = false;
    UsageSnapshot snapshot;
    FetchFailure failure;
};

FetchResult make_success(const UsageSnapshot& snapshot);
FetchResult make_failure(FailureKind kind, long http_code, const std::string& message);

// ============================================================================
// Function Declarations - CURL Utilities
// ============================================================================

// Callback function to write curl response body to string
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp);

// Callback function collecting "Name: value" response headers into a HeaderMap
size_t HeaderCallback(char* buffer, size_t size, size_t nitems, HeaderMap* userp);

// Check if response is successful HTTP code
bool is_http_success(long code);

// ============================================================================
// Function Declarations - String Utilities
// ============================================================================

std::string to_lower(const std::string& s);
std::string trim(const std::string& s);

// Keep the first max_len characters (UTF-8 code points)
std::string truncate_message(const std::string& s, size_t max_len);

// Parse a whole string as a base-10 integer; surrounding whitespace allowed
bool parse_int_strict(const std::string& s, long long* out);

// ============================================================================
// Function Declarations - Time Utilities
// ============================================================================

// Format as HH:MM:SS in local time
std::string format_clock_hms(time_t t);

// Format as 12-hour clock (e.g. "03:15 PM") in local time
std::string format_clock_12h(time_t t);

// Format remaining time as "Hh Mm" (hours > 0) or "Mm"
std::string format_duration_hm(int64_t seconds);

// ============================================================================
// Function Declarations - Paths & Logging
// ============================================================================

// $HOME, falling back to the passwd entry
const char* get_home_dir_fallback();

// Append a timestamped line to ~/.cache/usage-inspector.log and syslog
void app_log(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

#endif // USAGE_COMMON_H
