#include "kit/http.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace kit {

namespace {

size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// RAII wrapper for a header list
class CurlHeaders {
public:
    CurlHeaders() = default;
    ~CurlHeaders() { if (list_) curl_slist_free_all(list_); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    void append(const char* header) { list_ = curl_slist_append(list_, header); }
    curl_slist* get() { return list_; }

private:
    curl_slist* list_ = nullptr;
};

// Global curl initialization (thread-safe in modern libcurl)
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

} // namespace

HttpResponse http_perform(const HttpRequest& request) {
    HttpResponse result;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    CurlHeaders headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, request.timeout_ms);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "kit/" KIT_VERSION);

    if (request.method == "POST") {
        headers.append("Content-Type: application/json");
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        result.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        result.error = std::string("HTTP request failed: ") +
                       (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        spdlog::debug("{} {} failed: {}", request.method, request.url, result.error);
        return result;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
    result.ok = true;
    spdlog::debug("{} {} -> {}", request.method, request.url, result.status);
    return result;
}

HttpTransport default_http_transport() {
    return [](const HttpRequest& request) { return http_perform(request); };
}

const char* endpoint_state_to_string(EndpointState state) {
    switch (state) {
        case EndpointState::Up: return "up";
        case EndpointState::Down: return "down";
        case EndpointState::Unreachable: return "unreachable";
    }
    return "unreachable";
}

std::string EndpointProbe::describe() const {
    switch (state) {
        case EndpointState::Up:
            return "UP (" + std::to_string(status) + ")";
        case EndpointState::Down:
            return "DOWN (" + std::to_string(status) + ")";
        case EndpointState::Unreachable:
            break;
    }
    return error.empty() ? "UNREACHABLE" : "UNREACHABLE: " + error;
}

EndpointProbe probe_endpoint(const std::string& url, long timeout_ms,
                             const HttpTransport& transport) {
    EndpointProbe probe;
    probe.url = url;

    HttpRequest request;
    request.url = url;
    request.timeout_ms = timeout_ms;
    auto response = transport(request);

    if (!response.ok) {
        probe.state = EndpointState::Unreachable;
        probe.error = response.timed_out ? "timed out" : response.error;
        return probe;
    }
    probe.status = response.status;
    probe.state = response.success() ? EndpointState::Up : EndpointState::Down;
    return probe;
}

std::string url_origin(const std::string& url) {
    auto scheme = url.find("://");
    if (scheme == std::string::npos) return url;
    auto path = url.find('/', scheme + 3);
    if (path == std::string::npos) return url + "/";
    return url.substr(0, path + 1);
}

} // namespace kit
