#include "usage_common.h"

#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <pwd.h>
#include <syslog.h>
#include <sys/types.h>
#include <unistd.h>

// ============================================================================
// Result Constructors
// ============================================================================

FetchResult make_success(const UsageSnapshot& snapshot) {
    FetchResult out;
    out.success = true;
    out.snapshot = snapshot;
    return out;
}

FetchResult make_failure(FailureKind kind, long http_code, const std::string& message) {
    FetchResult out;
    out.success = false;
    out.failure.kind = kind;
    out.failure.http_code = http_code;
    out.failure.message = message;
    return out;
}

// ============================================================================
// CURL Utilities Implementation
// ============================================================================

size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append((char*)contents, total_size);
    return total_size;
}

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, HeaderMap* userp) {
    size_t total_size = size * nitems;
    std::string line(buffer, total_size);

    // A new status line starts a new header block (redirects, 100 Continue).
    if (line.rfind("HTTP/", 0) == 0) {
        userp->clear();
        return total_size;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return total_size;
    }

    std::string name = to_lower(trim(line.substr(0, colon)));
    std::string value = trim(line.substr(colon + 1));
    if (!name.empty()) {
        (*userp)[name] = value;
    }
    return total_size;
}

bool is_http_success(long code) {
    return code >= 200 && code < 300;
}

// ============================================================================
// String Utilities Implementation
// ============================================================================

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        c = (char)std::tolower((unsigned char)c);
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace((unsigned char)s[begin])) {
        begin++;
    }
    while (end > begin && std::isspace((unsigned char)s[end - 1])) {
        end--;
    }
    return s.substr(begin, end - begin);
}

std::string truncate_message(const std::string& s, size_t max_len) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); i++) {
        const unsigned char c = (unsigned char)s[i];
        if ((c & 0xC0) == 0x80) {
            continue;  // continuation byte
        }
        if (chars == max_len) {
            return s.substr(0, i);
        }
        chars++;
    }
    return s;
}

bool parse_int_strict(const std::string& s, long long* out) {
    if (!out) {
        return false;
    }

    const std::string t = trim(s);
    if (t.empty()) {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if (errno != 0 || end == t.c_str() || *end != '\0') {
        return false;
    }

    *out = v;
    return true;
}

// ============================================================================
// Time Utilities Implementation
// ============================================================================

std::string format_clock_hms(time_t t) {
    struct tm tm_info = {};
    localtime_r(&t, &tm_info);
    char buffer[16];
    strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm_info);
    return std::string(buffer);
}

std::string format_clock_12h(time_t t) {
    struct tm tm_info = {};
    localtime_r(&t, &tm_info);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%I:%M %p", &tm_info);
    return std::string(buffer);
}

std::string format_duration_hm(int64_t seconds) {
    if (seconds < 0) {
        seconds = 0;
    }

    int64_t hours = seconds / 3600;
    int64_t minutes = (seconds % 3600) / 60;

    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }
    return std::to_string(minutes) + "m";
}

// ============================================================================
// Paths & Logging Implementation
// ============================================================================

const char* get_home_dir_fallback() {
    const char* home = getenv("HOME");
    if (home && *home) {
        return home;
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir && pw->pw_dir[0] != '\0') {
        return pw->pw_dir;
    }
    return nullptr;
}

void app_log(const char* fmt, ...) {
    const char* home = get_home_dir_fallback();

    std::string path;
    if (home && *home) {
        path = std::string(home) + "/.cache/usage-inspector.log";
    } else {
        path = "/tmp/usage-inspector.log";
    }

    char msg[512];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    FILE* f = fopen(path.c_str(), "a");
    if (f) {
        std::time_t t = std::time(nullptr);
        std::tm tmv{};
        localtime_r(&t, &tmv);
        char ts[32];
        strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tmv);
        fprintf(f, "[%s] %s\n", ts, msg);
        fclose(f);
    }

    openlog(kAppId, LOG_PID, LOG_USER);
    syslog(LOG_INFO, "%s", msg);
    closelog();
}
