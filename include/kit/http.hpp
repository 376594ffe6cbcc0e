#pragma once

#include <functional>
#include <string>

namespace kit {

// ============================================================================
// HTTP Client (libcurl)
// ============================================================================

struct HttpRequest {
    std::string method = "GET";  // "GET" or "POST"
    std::string url;
    std::string body;            // sent as application/json when method is POST
    long timeout_ms = 10000;     // total transfer budget
};

struct HttpResponse {
    bool ok = false;             // transport succeeded (any HTTP status)
    bool timed_out = false;
    long status = 0;
    std::string body;
    std::string error;

    bool success() const { return ok && status >= 200 && status < 300; }
};

// Pluggable transport so callers can substitute a fake in tests
using HttpTransport = std::function<HttpResponse(const HttpRequest&)>;

// Perform a request with libcurl
HttpResponse http_perform(const HttpRequest& request);

// Default transport backed by http_perform
HttpTransport default_http_transport();

// ============================================================================
// Reachability
// ============================================================================

enum class EndpointState {
    Up,          // 2xx
    Down,        // answered with another status
    Unreachable  // no HTTP answer at all
};

const char* endpoint_state_to_string(EndpointState state);

struct EndpointProbe {
    std::string url;
    EndpointState state = EndpointState::Unreachable;
    long status = 0;
    std::string error;

    bool up() const { return state == EndpointState::Up; }
    std::string describe() const;  // "UP (200)", "DOWN (503)", "UNREACHABLE: ..."
};

// Timed GET of `url`
EndpointProbe probe_endpoint(const std::string& url, long timeout_ms,
                             const HttpTransport& transport);

// "scheme://host[:port]/" of a URL, or the URL unchanged when it has no scheme
std::string url_origin(const std::string& url);

} // namespace kit
