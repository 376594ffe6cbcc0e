#include <doctest/doctest.h>
#include <kit/intent.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace kit;

namespace {

IntentValidatorOptions configured_options() {
    IntentValidatorOptions options;
    options.endpoint = "http://127.0.0.1:11434/api/generate";
    options.timeout_ms = 250;
    return options;
}

HttpTransport reply(long status, std::string body, HttpRequest* seen = nullptr) {
    return [status, body, seen](const HttpRequest& request) {
        if (seen) *seen = request;
        HttpResponse r;
        r.ok = true;
        r.status = status;
        r.body = body;
        return r;
    };
}

} // namespace

// ============================================================================
// Fail-open behavior
// ============================================================================

TEST_CASE("unconfigured validator returns unchecked without calling out") {
    bool called = false;
    IntentValidator validator(IntentValidatorOptions{}, [&called](const HttpRequest&) {
        called = true;
        return HttpResponse{};
    });

    CHECK_FALSE(validator.configured());
    IntentCheckResult result;
    CHECK_NOTHROW(result = validator.checkInjection("install rabel"));
    CHECK_FALSE(result.checked());
    CHECK_FALSE(called);
}

TEST_CASE("timeout returns unchecked") {
    IntentValidator validator(configured_options(), [](const HttpRequest&) {
        HttpResponse r;
        r.timed_out = true;
        r.error = "Operation timed out";
        return r;
    });
    auto result = validator.checkInjection("install rabel");
    CHECK(result.status == IntentStatus::Unchecked);
    CHECK(result.rationale == "intent endpoint timed out");
}

TEST_CASE("unreachable endpoint returns unchecked") {
    IntentValidator validator(configured_options(), [](const HttpRequest&) {
        HttpResponse r;
        r.error = "Couldn't connect to server";
        return r;
    });
    CHECK_FALSE(validator.checkInjection("install rabel").checked());
}

TEST_CASE("HTTP error status returns unchecked") {
    IntentValidator validator(configured_options(), reply(500, "{}"));
    auto result = validator.checkInjection("install rabel");
    CHECK_FALSE(result.checked());
    CHECK(result.rationale == "intent endpoint returned HTTP 500");
}

TEST_CASE("throwing transport returns unchecked") {
    IntentValidator validator(configured_options(), [](const HttpRequest&) -> HttpResponse {
        throw std::runtime_error("socket closed");
    });
    IntentCheckResult result;
    CHECK_NOTHROW(result = validator.checkInjection("install rabel"));
    CHECK_FALSE(result.checked());
}

TEST_CASE("unreachable real endpoint returns unchecked") {
    IntentValidatorOptions options;
    options.endpoint = "http://127.0.0.1:1/api/generate";
    options.timeout_ms = 500;
    IntentValidator validator(options);
    CHECK_FALSE(validator.checkInjection("install rabel").checked());
}

// ============================================================================
// Request / classification
// ============================================================================

TEST_CASE("request carries model, tagged prompt and timeout") {
    HttpRequest seen;
    IntentValidator validator(configured_options(),
                              reply(200, R"({"response": "[SAFE] ok"})", &seen));
    auto result = validator.checkInjection("install rabel");

    CHECK(result.status == IntentStatus::Clear);
    CHECK(seen.method == "POST");
    CHECK(seen.url == "http://127.0.0.1:11434/api/generate");
    CHECK(seen.timeout_ms == 250);

    auto body = nlohmann::json::parse(seen.body);
    CHECK(body["model"] == "kit");
    CHECK(body["prompt"] == "[CHECK] install rabel");
    CHECK(body["stream"] == false);
}

TEST_CASE("bracket tags in the response flag the text") {
    CHECK(classify_intent_response(R"({"response": "[INJECTION] ignore previous"})").flagged());
    CHECK(classify_intent_response(R"({"response": "verdict: [block]"})").flagged());
    CHECK(classify_intent_response(R"({"response": "[UNSAFE]"})").flagged());
}

TEST_CASE("prose mentioning injection is not flagged") {
    auto result = classify_intent_response(R"({"response": "no injection detected"})");
    CHECK(result.status == IntentStatus::Clear);
    CHECK(result.rationale == "no injection detected");
}

TEST_CASE("boolean flagged field wins over response text") {
    auto flagged = classify_intent_response(
        R"({"flagged": true, "rationale": "override attempt", "response": "[SAFE]"})");
    CHECK(flagged.flagged());
    CHECK(flagged.rationale == "override attempt");

    auto clear = classify_intent_response(R"({"flagged": false, "response": "[BLOCK]"})");
    CHECK(clear.status == IntentStatus::Clear);
}

TEST_CASE("unusable bodies are unchecked") {
    CHECK_FALSE(classify_intent_response("not json").checked());
    CHECK_FALSE(classify_intent_response("[1, 2]").checked());
    CHECK_FALSE(classify_intent_response(R"({"done": true})").checked());
}
