#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kit {

// ============================================================================
// Ecosystem (closed set of installer backends)
// ============================================================================

enum class Ecosystem {
    Pip,
    Npm
};

inline const char* ecosystem_to_string(Ecosystem e) {
    switch (e) {
        case Ecosystem::Pip: return "pip";
        case Ecosystem::Npm: return "npm";
    }
    return "unknown";
}

// Parse an ecosystem tag (case-insensitive). "pypi" is accepted as pip.
std::optional<Ecosystem> parse_ecosystem(const std::string& tag);

// ============================================================================
// Package Record
// ============================================================================

struct PackageRecord {
    std::string name;
    std::string version = "0.0.0";
    std::string description;
    std::string author = "Unknown";

    std::string ecosystem;  // registry tag, validated at install time
    std::string target;     // distribution name handed to the installer

    bool compliant = false;
    bool verified = false;
    double trust_score = 0.0;  // [0.0, 1.0]

    std::vector<std::string> dependencies;
    std::optional<std::string> mcp_command;
};

bool operator==(const PackageRecord& a, const PackageRecord& b);
inline bool operator!=(const PackageRecord& a, const PackageRecord& b) { return !(a == b); }

// ============================================================================
// Intent Check Result
// ============================================================================

enum class IntentStatus {
    Unchecked,
    Clear,
    Flagged
};

inline const char* intent_status_to_string(IntentStatus s) {
    switch (s) {
        case IntentStatus::Unchecked: return "unchecked";
        case IntentStatus::Clear: return "clear";
        case IntentStatus::Flagged: return "flagged";
    }
    return "unchecked";
}

std::optional<IntentStatus> parse_intent_status(const std::string& s);

struct IntentCheckResult {
    IntentStatus status = IntentStatus::Unchecked;
    std::string rationale;

    bool checked() const { return status != IntentStatus::Unchecked; }
    bool flagged() const { return status == IntentStatus::Flagged; }
};

// ============================================================================
// Policy Decision
// ============================================================================

// Produced once per evaluation and never modified afterwards.
struct PolicyDecision {
    std::string package;
    bool verdict = false;
    double min_trust = 0.5;
    std::vector<std::string> reasons;
    std::optional<IntentCheckResult> intent;
};

// ============================================================================
// Install Result
// ============================================================================

struct InstallResult {
    std::string package;
    std::string installer;              // backend name ("pip", "npm")
    std::vector<std::string> command;   // argv actually executed
    int exit_code = -1;
    std::string output;                 // combined stdout/stderr, verbatim
    bool success = false;
    bool timed_out = false;
    std::string timestamp;              // RFC3339
};

// ============================================================================
// Gateway Outcome Status
// ============================================================================

enum class OutcomeStatus {
    Installed,
    NotFound,
    PolicyDenied,
    UnsupportedEcosystem,
    InstallerUnavailable,
    InstallFailed
};

inline const char* outcome_status_to_string(OutcomeStatus s) {
    switch (s) {
        case OutcomeStatus::Installed: return "installed";
        case OutcomeStatus::NotFound: return "not_found";
        case OutcomeStatus::PolicyDenied: return "policy_denied";
        case OutcomeStatus::UnsupportedEcosystem: return "unsupported_ecosystem";
        case OutcomeStatus::InstallerUnavailable: return "installer_unavailable";
        case OutcomeStatus::InstallFailed: return "install_failed";
    }
    return "unknown";
}

std::optional<OutcomeStatus> parse_outcome_status(const std::string& s);

// ============================================================================
// Audit Record
// ============================================================================

struct AuditRecord {
    uint64_t sequence = 0;
    std::string timestamp;  // RFC3339
    std::string package;    // name as requested
    std::string actor;
    OutcomeStatus outcome = OutcomeStatus::NotFound;
    std::optional<std::string> abort_reason;
    std::optional<PolicyDecision> decision;
    std::optional<InstallResult> install;
    std::string prev_hash;
    std::string hash;
};

} // namespace kit
