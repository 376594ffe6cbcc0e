#pragma once

/**
 * @file gateway.hpp
 * @brief Per-package install pipeline: lookup, policy, intent, install, audit
 *
 * One Gateway::install() call runs one invocation:
 *
 *   LookedUp -> Evaluated -> [IntentChecked] -> Decided
 *            -> Installed | Skipped -> Audited -> Done
 *
 * Unknown names and unsupported ecosystems end in Aborted. Every
 * invocation, aborted or not, appends exactly one audit record.
 */

#include "kit/audit.hpp"
#include "kit/installer.hpp"
#include "kit/intent.hpp"
#include "kit/policy.hpp"
#include "kit/registry.hpp"
#include "kit/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kit {

enum class Stage {
    LookedUp,
    Evaluated,
    IntentChecked,
    Decided,
    Installed,
    Skipped,
    Audited,
    Done,
    Aborted,
};

const char* stage_to_string(Stage stage);

// Process exit codes for each outcome
constexpr int EXIT_AUDIT_FAILED = 7;
int outcome_exit_code(OutcomeStatus status);

struct GatewayOptions {
    double min_trust = DEFAULT_MIN_TRUST;
    bool intent_enabled = true;
    bool deny_on_flagged = false;
    std::string actor = "unknown";
};

struct GatewayOutcome {
    OutcomeStatus status = OutcomeStatus::NotFound;
    std::string package;  // name as requested

    std::optional<PackageRecord> record;
    std::optional<PolicyDecision> decision;
    std::optional<InstallResult> install;

    std::optional<std::string> abort_reason;
    std::string message;  // one-line summary for the caller

    std::vector<std::string> missing_dependencies;
    std::vector<Stage> stages;

    std::optional<AuditRecord> audit;
    std::optional<std::string> audit_error;  // set when the audit append failed

    bool audited() const { return audit.has_value(); }

    // True only for a recorded, successful install
    bool ok() const { return status == OutcomeStatus::Installed && audited(); }

    int exit_code() const;
};

class Gateway {
public:
    Gateway(const RegistryStore& registry,
            const IntentValidator& intent,
            const InstallerRouter& installer,
            AuditTrail& audit,
            GatewayOptions options = {});

    const GatewayOptions& options() const { return options_; }

    /// Run one invocation for `name`. Never throws for domain failures;
    /// every failure is reported through GatewayOutcome::status.
    GatewayOutcome install(const std::string& name) const;

    /// Policy and intent only; nothing is installed or audited.
    GatewayOutcome evaluate(const std::string& name) const;

    /// Run invocations in order; one outcome per name.
    std::vector<GatewayOutcome> installMany(const std::vector<std::string>& names) const;

private:
    GatewayOutcome decide(const std::string& name, const Registry& registry) const;
    void finish(GatewayOutcome& outcome) const;

    const RegistryStore& registry_;
    const IntentValidator& intent_;
    const InstallerRouter& installer_;
    AuditTrail& audit_;
    GatewayOptions options_;
};

// Text sent to the intent endpoint for a record
std::string build_intent_prompt(const PackageRecord& record);

} // namespace kit
