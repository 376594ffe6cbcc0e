#include "kit/policy.hpp"

#include <cmath>
#include <sstream>

namespace kit {

std::string format_score(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

bool is_valid_threshold(double min_trust) {
    return std::isfinite(min_trust) && min_trust >= 0.0 && min_trust <= 1.0;
}

PolicyDecision evaluate_policy(const PackageRecord& record, double min_trust) {
    PolicyDecision decision;
    decision.package = record.name;
    decision.min_trust = min_trust;

    if (!record.compliant) {
        decision.reasons.push_back(REASON_NOT_COMPLIANT);
    }
    if (!record.verified) {
        decision.reasons.push_back(REASON_NOT_VERIFIED);
    }
    // Written as !(a >= b) so a NaN threshold fails rather than passes
    if (!(record.trust_score >= min_trust)) {
        decision.reasons.push_back("trust score " + format_score(record.trust_score) +
                                   " below threshold " + format_score(min_trust));
    }

    decision.verdict = decision.reasons.empty();
    return decision;
}

PolicyDecision with_intent(const PolicyDecision& decision,
                           const IntentCheckResult& intent,
                           bool deny_on_flagged) {
    PolicyDecision result = decision;
    result.intent = intent;

    if (deny_on_flagged && intent.flagged()) {
        std::string reason = "intent check flagged";
        if (!intent.rationale.empty()) {
            reason += ": " + intent.rationale;
        }
        result.reasons.push_back(reason);
        result.verdict = false;
    }

    return result;
}

} // namespace kit
