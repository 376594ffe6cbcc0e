#include "kit/types.hpp"

#include <algorithm>
#include <cctype>

namespace kit {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Ecosystem> parse_ecosystem(const std::string& tag) {
    std::string lower = to_lower(tag);
    if (lower == "pip" || lower == "pypi") return Ecosystem::Pip;
    if (lower == "npm") return Ecosystem::Npm;
    return std::nullopt;
}

std::optional<IntentStatus> parse_intent_status(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "unchecked") return IntentStatus::Unchecked;
    if (lower == "clear") return IntentStatus::Clear;
    if (lower == "flagged") return IntentStatus::Flagged;
    return std::nullopt;
}

std::optional<OutcomeStatus> parse_outcome_status(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "installed") return OutcomeStatus::Installed;
    if (lower == "not_found") return OutcomeStatus::NotFound;
    if (lower == "policy_denied") return OutcomeStatus::PolicyDenied;
    if (lower == "unsupported_ecosystem") return OutcomeStatus::UnsupportedEcosystem;
    if (lower == "installer_unavailable") return OutcomeStatus::InstallerUnavailable;
    if (lower == "install_failed") return OutcomeStatus::InstallFailed;
    return std::nullopt;
}

bool operator==(const PackageRecord& a, const PackageRecord& b) {
    return a.name == b.name &&
           a.version == b.version &&
           a.description == b.description &&
           a.author == b.author &&
           a.ecosystem == b.ecosystem &&
           a.target == b.target &&
           a.compliant == b.compliant &&
           a.verified == b.verified &&
           a.trust_score == b.trust_score &&
           a.dependencies == b.dependencies &&
           a.mcp_command == b.mcp_command;
}

} // namespace kit
