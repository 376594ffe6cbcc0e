#pragma once

#include "kit/types.hpp"

#include <string>

namespace kit {

// ============================================================================
// Policy Evaluation
// ============================================================================

constexpr double DEFAULT_MIN_TRUST = 0.5;

// Reason strings recorded for failing checks
constexpr const char* REASON_NOT_COMPLIANT = "not compliant";
constexpr const char* REASON_NOT_VERIFIED = "not verified";

// verdict = compliant && verified && trust_score >= min_trust.
// Every failing check adds one reason. Pure: no I/O, no network.
PolicyDecision evaluate_policy(const PackageRecord& record,
                               double min_trust = DEFAULT_MIN_TRUST);

// Returns a new decision carrying the intent sub-result. When
// deny_on_flagged is set and the intent was flagged, the verdict is false
// and an "intent check flagged" reason is added.
PolicyDecision with_intent(const PolicyDecision& decision,
                           const IntentCheckResult& intent,
                           bool deny_on_flagged);

// True when min_trust is a usable threshold (finite and within [0, 1])
bool is_valid_threshold(double min_trust);

// Decimal form used in reasons, six significant digits ("0.3", "0.95")
std::string format_score(double value);

} // namespace kit
