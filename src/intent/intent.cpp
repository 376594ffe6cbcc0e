#include "kit/intent.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace kit {

namespace {

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

// Verdict tags the model is prompted to answer with
const char* const FLAG_TAGS[] = {"[BLOCK]", "[DENY]", "[FLAGGED]", "[INJECTION]", "[UNSAFE]"};

IntentCheckResult unchecked(std::string rationale) {
    IntentCheckResult result;
    result.status = IntentStatus::Unchecked;
    result.rationale = std::move(rationale);
    return result;
}

} // namespace

IntentCheckResult classify_intent_response(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return unchecked(std::string("unparsable response: ") + e.what());
    }

    if (!j.is_object()) {
        return unchecked("response is not an object");
    }

    IntentCheckResult result;
    if (j.contains("response") && j["response"].is_string()) {
        result.rationale = j["response"].get<std::string>();
    }

    if (j.contains("flagged") && j["flagged"].is_boolean()) {
        result.status = j["flagged"].get<bool>() ? IntentStatus::Flagged : IntentStatus::Clear;
        if (j.contains("rationale") && j["rationale"].is_string()) {
            result.rationale = j["rationale"].get<std::string>();
        }
        return result;
    }

    if (!j.contains("response") || !j["response"].is_string()) {
        return unchecked("response carries no classification");
    }

    std::string upper = to_upper(result.rationale);
    bool flagged = std::any_of(std::begin(FLAG_TAGS), std::end(FLAG_TAGS),
                               [&upper](const char* tag) {
                                   return upper.find(tag) != std::string::npos;
                               });
    result.status = flagged ? IntentStatus::Flagged : IntentStatus::Clear;
    return result;
}

IntentValidator::IntentValidator(IntentValidatorOptions options, HttpTransport transport)
    : options_(std::move(options)), transport_(std::move(transport)) {}

IntentCheckResult IntentValidator::checkInjection(const std::string& text) const {
    if (!configured() || !transport_) {
        spdlog::debug("intent check skipped: no endpoint configured");
        return unchecked("intent endpoint not configured");
    }

    nlohmann::json payload;
    payload["model"] = options_.model;
    payload["prompt"] = "[CHECK] " + text;
    payload["stream"] = false;
    payload["options"]["num_predict"] = 50;

    HttpRequest request;
    request.method = "POST";
    request.url = options_.endpoint;
    request.body = payload.dump();
    request.timeout_ms = options_.timeout_ms;

    HttpResponse response;
    try {
        response = transport_(request);
    } catch (const std::exception& e) {
        spdlog::warn("intent check unavailable: {}", e.what());
        return unchecked(std::string("intent endpoint error: ") + e.what());
    }

    if (!response.ok) {
        if (response.timed_out) {
            spdlog::warn("intent check timed out after {} ms", options_.timeout_ms);
            return unchecked("intent endpoint timed out");
        }
        spdlog::warn("intent check unavailable: {}", response.error);
        return unchecked("intent endpoint unreachable");
    }

    if (!response.success()) {
        spdlog::warn("intent check unavailable: HTTP {}", response.status);
        return unchecked("intent endpoint returned HTTP " + std::to_string(response.status));
    }

    auto result = classify_intent_response(response.body);
    if (!result.checked()) {
        spdlog::warn("intent check unavailable: {}", result.rationale);
    } else if (result.flagged()) {
        spdlog::warn("intent check flagged: {}", result.rationale);
    } else {
        spdlog::debug("intent check clear");
    }
    return result;
}

} // namespace kit
