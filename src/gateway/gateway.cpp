#include "kit/gateway.hpp"

#include <spdlog/spdlog.h>

namespace kit {

const char* stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::LookedUp: return "looked_up";
        case Stage::Evaluated: return "evaluated";
        case Stage::IntentChecked: return "intent_checked";
        case Stage::Decided: return "decided";
        case Stage::Installed: return "installed";
        case Stage::Skipped: return "skipped";
        case Stage::Audited: return "audited";
        case Stage::Done: return "done";
        case Stage::Aborted: return "aborted";
    }
    return "unknown";
}

int outcome_exit_code(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Installed: return 0;
        case OutcomeStatus::NotFound: return 2;
        case OutcomeStatus::PolicyDenied: return 3;
        case OutcomeStatus::UnsupportedEcosystem: return 4;
        case OutcomeStatus::InstallerUnavailable: return 5;
        case OutcomeStatus::InstallFailed: return 6;
    }
    return 1;
}

int GatewayOutcome::exit_code() const {
    if (audit_error) return EXIT_AUDIT_FAILED;
    return outcome_exit_code(status);
}

std::string build_intent_prompt(const PackageRecord& record) {
    std::string text = "Is this package installation safe? Package: " + record.name;
    if (!record.description.empty()) {
        text += ". Description: " + record.description;
    }
    return text;
}

Gateway::Gateway(const RegistryStore& registry,
                 const IntentValidator& intent,
                 const InstallerRouter& installer,
                 AuditTrail& audit,
                 GatewayOptions options)
    : registry_(registry),
      intent_(intent),
      installer_(installer),
      audit_(audit),
      options_(std::move(options)) {}

GatewayOutcome Gateway::decide(const std::string& name, const Registry& registry) const {
    GatewayOutcome outcome;
    outcome.package = name;

    auto found = registry.lookup(name);
    if (found.isErr()) {
        outcome.status = OutcomeStatus::NotFound;
        outcome.abort_reason = "not found";
        outcome.message = "package not found: " + name;
        return outcome;
    }
    outcome.record = found.value();
    outcome.stages.push_back(Stage::LookedUp);
    const PackageRecord& record = *outcome.record;

    for (const auto& dep : record.dependencies) {
        if (!registry.contains(dep)) {
            outcome.missing_dependencies.push_back(dep);
        }
    }

    PolicyDecision decision = evaluate_policy(record, options_.min_trust);
    outcome.stages.push_back(Stage::Evaluated);

    // Unsupported ecosystems abort before the intent endpoint is called
    if (decision.verdict) {
        auto ecosystem = installer_.resolve(record);
        if (ecosystem.isErr()) {
            outcome.decision = decision;
            outcome.stages.push_back(Stage::Decided);
            outcome.status = OutcomeStatus::UnsupportedEcosystem;
            outcome.abort_reason = ecosystem.error().message();
            outcome.message = record.name + ": " + ecosystem.error().message();
            return outcome;
        }
    }

    if (decision.verdict && options_.intent_enabled && intent_.configured()) {
        auto intent = intent_.checkInjection(build_intent_prompt(record));
        decision = with_intent(decision, intent, options_.deny_on_flagged);
        outcome.stages.push_back(Stage::IntentChecked);
    }

    outcome.decision = decision;
    outcome.stages.push_back(Stage::Decided);

    if (!decision.verdict) {
        outcome.status = OutcomeStatus::PolicyDenied;
        std::string joined;
        for (const auto& reason : decision.reasons) {
            if (!joined.empty()) joined += "; ";
            joined += reason;
        }
        outcome.message = record.name + " denied: " + joined;
        return outcome;
    }

    // Provisional; install() replaces it with the real result
    outcome.status = OutcomeStatus::Installed;
    outcome.message = record.name + " passed policy";
    return outcome;
}

GatewayOutcome Gateway::evaluate(const std::string& name) const {
    RegistrySnapshot registry = registry_.snapshot();
    return decide(name, *registry);
}

GatewayOutcome Gateway::install(const std::string& name) const {
    RegistrySnapshot registry = registry_.snapshot();
    GatewayOutcome outcome = decide(name, *registry);

    bool attempt = outcome.decision && outcome.decision->verdict && !outcome.abort_reason;
    if (!attempt) {
        if (outcome.decision && !outcome.abort_reason) {
            outcome.stages.push_back(Stage::Skipped);
        }
        finish(outcome);
        return outcome;
    }

    const PackageRecord& record = *outcome.record;
    auto installed = installer_.install(record);
    if (installed.isErr()) {
        // Ecosystem was resolved in decide(), so only spawn failures land here
        outcome.status = installed.error().code() == ErrorCode::UNSUPPORTED_ECOSYSTEM
                             ? OutcomeStatus::UnsupportedEcosystem
                             : OutcomeStatus::InstallerUnavailable;
        outcome.abort_reason = installed.error().message();
        outcome.message = record.name + ": " + installed.error().message();
        outcome.stages.push_back(Stage::Skipped);
        finish(outcome);
        return outcome;
    }

    outcome.install = installed.value();
    outcome.stages.push_back(Stage::Installed);
    if (outcome.install->success) {
        outcome.status = OutcomeStatus::Installed;
        outcome.message = record.name + " " + record.version + " installed";
    } else {
        outcome.status = OutcomeStatus::InstallFailed;
        outcome.message = outcome.install->timed_out
                              ? record.name + " install timed out"
                              : record.name + " install failed with exit code " +
                                    std::to_string(outcome.install->exit_code);
    }

    finish(outcome);
    return outcome;
}

void Gateway::finish(GatewayOutcome& outcome) const {
    AuditEntry entry;
    entry.package = outcome.record ? outcome.record->name : outcome.package;
    entry.actor = options_.actor;
    entry.outcome = outcome.status;
    entry.abort_reason = outcome.abort_reason;
    entry.decision = outcome.decision;
    entry.install = outcome.install;

    bool aborted = outcome.status == OutcomeStatus::NotFound ||
                   outcome.status == OutcomeStatus::UnsupportedEcosystem;

    auto recorded = audit_.record(entry);
    if (recorded.isErr()) {
        outcome.audit_error = recorded.error().message();
        outcome.stages.push_back(Stage::Aborted);
        spdlog::error("audit write failed for {}: {}; install state is unaudited",
                      entry.package, recorded.error().message());
        return;
    }

    outcome.audit = recorded.value();
    outcome.stages.push_back(Stage::Audited);
    outcome.stages.push_back(aborted ? Stage::Aborted : Stage::Done);
    spdlog::debug("{} -> {} (audit #{})", entry.package,
                  outcome_status_to_string(outcome.status), outcome.audit->sequence);
}

std::vector<GatewayOutcome> Gateway::installMany(const std::vector<std::string>& names) const {
    std::vector<GatewayOutcome> outcomes;
    outcomes.reserve(names.size());
    for (const auto& name : names) {
        outcomes.push_back(install(name));
    }
    return outcomes;
}

} // namespace kit
