#pragma once

/**
 * @file intent.hpp
 * @brief Advisory injection check against a local inference endpoint
 *
 * The check fails open: when the endpoint is unconfigured, unreachable,
 * slow, or returns something unusable, the result is IntentStatus::Unchecked
 * and nothing is thrown. The static policy stays the authoritative gate.
 */

#include "kit/http.hpp"
#include "kit/types.hpp"

#include <string>

namespace kit {

struct IntentValidatorOptions {
    std::string endpoint;     // e.g. http://127.0.0.1:11434/api/generate; empty disables
    std::string model = "kit";
    long timeout_ms = 5000;
};

class IntentValidator {
public:
    explicit IntentValidator(IntentValidatorOptions options,
                             HttpTransport transport = default_http_transport());

    bool configured() const { return !options_.endpoint.empty(); }
    const IntentValidatorOptions& options() const { return options_; }

    /// Classify free text. Never throws.
    IntentCheckResult checkInjection(const std::string& text) const;

private:
    IntentValidatorOptions options_;
    HttpTransport transport_;
};

// Classify an endpoint response body. A boolean "flagged" field wins;
// otherwise the "response" text is scanned for injection markers.
// Returns Unchecked when the body is not usable JSON.
IntentCheckResult classify_intent_response(const std::string& body);

} // namespace kit
