#include <doctest/doctest.h>
#include <kit/http.hpp>

using namespace kit;

namespace {

HttpTransport answer(long status) {
    return [status](const HttpRequest&) {
        HttpResponse r;
        r.ok = true;
        r.status = status;
        return r;
    };
}

} // namespace

TEST_CASE("probe_endpoint classifies the answer") {
    SUBCASE("2xx is up") {
        auto probe = probe_endpoint("http://127.0.0.1:11434/", 500, answer(200));
        CHECK(probe.up());
        CHECK(probe.status == 200);
        CHECK(probe.describe() == "UP (200)");
    }

    SUBCASE("other status is down") {
        auto probe = probe_endpoint("http://127.0.0.1:11434/", 500, answer(503));
        CHECK(probe.state == EndpointState::Down);
        CHECK(probe.describe() == "DOWN (503)");
    }

    SUBCASE("transport failure is unreachable") {
        auto probe = probe_endpoint("http://127.0.0.1:9/", 500, [](const HttpRequest&) {
            HttpResponse r;
            r.error = "HTTP request failed: Connection refused";
            return r;
        });
        CHECK(probe.state == EndpointState::Unreachable);
        CHECK(probe.describe() == "UNREACHABLE: HTTP request failed: Connection refused");
    }

    SUBCASE("timeout is unreachable") {
        auto probe = probe_endpoint("http://10.255.255.1/", 500, [](const HttpRequest&) {
            HttpResponse r;
            r.timed_out = true;
            return r;
        });
        CHECK(probe.describe() == "UNREACHABLE: timed out");
    }
}

TEST_CASE("probe_endpoint sends a timed GET") {
    HttpRequest seen;
    probe_endpoint("https://registry.example/packages.json", 1234, [&seen](const HttpRequest& r) {
        seen = r;
        return HttpResponse{};
    });
    CHECK(seen.method == "GET");
    CHECK(seen.url == "https://registry.example/packages.json");
    CHECK(seen.timeout_ms == 1234);
}

TEST_CASE("url_origin strips the path") {
    CHECK(url_origin("http://127.0.0.1:11434/api/generate") == "http://127.0.0.1:11434/");
    CHECK(url_origin("https://example.org") == "https://example.org/");
    CHECK(url_origin("localhost:8000/health") == "localhost:8000/health");
}
