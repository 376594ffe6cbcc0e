/**
 * kit CLI - install command
 *
 * Run each requested package through the gateway: registry lookup,
 * policy, optional intent check, installer, audit record.
 *
 * Exit code is that of the first package that did not install cleanly:
 * 2 not found, 3 policy denied, 4 unsupported ecosystem, 5 installer
 * unavailable, 6 install failed, 7 audit write failed.
 */

#include "../common.hpp"
#include <kit/gateway.hpp>
#include <kit/policy.hpp>
#include <kit/serialize.hpp>
#include <CLI/CLI.hpp>

#include <optional>

namespace kit::cli::commands {

namespace {

struct InstallOptions {
    std::vector<std::string> names;
    std::optional<double> min_trust;
    bool no_intent = false;
    bool deny_flagged = false;
    bool dry_run = false;
};

nlohmann::json outcome_to_json(const GatewayOutcome& outcome) {
    nlohmann::json j;
    j["package"] = outcome.package;
    j["status"] = outcome_status_to_string(outcome.status);
    j["exit_code"] = outcome.exit_code();
    j["message"] = outcome.message;
    j["abort_reason"] = outcome.abort_reason ? nlohmann::json(*outcome.abort_reason)
                                             : nlohmann::json(nullptr);
    j["decision"] = outcome.decision ? policy_decision_to_json(*outcome.decision)
                                     : nlohmann::json(nullptr);
    j["install"] = outcome.install ? install_result_to_json(*outcome.install)
                                   : nlohmann::json(nullptr);
    j["missing_dependencies"] = outcome.missing_dependencies;

    nlohmann::json stages = nlohmann::json::array();
    for (auto stage : outcome.stages) stages.push_back(stage_to_string(stage));
    j["stages"] = stages;

    if (outcome.audit) {
        j["audit"] = {{"sequence", outcome.audit->sequence}, {"hash", outcome.audit->hash}};
    }
    if (outcome.audit_error) {
        j["audit_error"] = *outcome.audit_error;
    }
    return j;
}

void print_outcome(const GatewayOutcome& outcome, bool dry_run) {
    if (outcome.record) {
        const auto& record = *outcome.record;
        std::cout << "[check] " << record.name << " " << record.version << std::endl;
        std::cout << "  trust " << format_score(record.trust_score)
                  << ", compliant " << (record.compliant ? "yes" : "no")
                  << ", verified " << (record.verified ? "yes" : "no") << std::endl;
    }
    if (outcome.decision && outcome.decision->intent) {
        const auto& intent = *outcome.decision->intent;
        std::cout << "  intent " << intent_status_to_string(intent.status);
        if (!intent.rationale.empty()) std::cout << ": " << intent.rationale;
        std::cout << std::endl;
    }
    for (const auto& dep : outcome.missing_dependencies) {
        print_warning(outcome.package + ": dependency not in registry: " + dep);
    }

    if (dry_run) {
        bool allowed = outcome.decision && outcome.decision->verdict && !outcome.abort_reason;
        std::cout << (allowed ? "[allow] " : "[block] ") << outcome.message << std::endl;
        if (outcome.decision) {
            for (const auto& reason : outcome.decision->reasons) {
                std::cout << "  - " << reason << std::endl;
            }
        }
        return;
    }

    switch (outcome.status) {
        case OutcomeStatus::Installed:
            std::cout << "[done] " << outcome.message << std::endl;
            if (outcome.record && outcome.record->mcp_command) {
                std::cout << "  MCP command: " << *outcome.record->mcp_command << std::endl;
            }
            break;
        case OutcomeStatus::PolicyDenied:
            std::cerr << "[blocked] " << outcome.package << std::endl;
            for (const auto& reason : outcome.decision->reasons) {
                std::cerr << "  - " << reason << std::endl;
            }
            break;
        case OutcomeStatus::InstallFailed:
            std::cerr << "[failed] " << outcome.message << std::endl;
            if (outcome.install && !outcome.install->output.empty()) {
                std::cerr << outcome.install->output;
                if (outcome.install->output.back() != '\n') std::cerr << std::endl;
            }
            break;
        default:
            std::cerr << "[error] " << outcome.message << std::endl;
            break;
    }

    if (outcome.audit_error) {
        std::cerr << "[audit] write failed: " << *outcome.audit_error << std::endl;
        std::cerr << "  " << outcome.package << " is "
                  << (outcome.status == OutcomeStatus::Installed ? "installed but " : "")
                  << "NOT recorded in the audit log" << std::endl;
    }
}

int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts) {
    init_warning_collector(opts.json, opts.quiet);

    if (install_opts.min_trust && !is_valid_threshold(*install_opts.min_trust)) {
        print_error("--min-trust must be within [0, 1]", opts.json);
        return 1;
    }

    auto loaded = load_context(opts, !install_opts.dry_run);
    if (loaded.isErr()) {
        print_error(loaded.error().toString(), opts.json);
        return 1;
    }
    KitContext& ctx = loaded.value();

    GatewayOptions gw_opts;
    gw_opts.min_trust = install_opts.min_trust.value_or(ctx.config.min_trust);
    gw_opts.intent_enabled = ctx.config.intent.enabled && !install_opts.no_intent;
    gw_opts.deny_on_flagged = ctx.config.intent.deny_on_flagged || install_opts.deny_flagged;
    gw_opts.actor = ctx.config.audit.actor;

    IntentValidator validator(intent_validator_options(ctx.config));
    InstallerRouter router(ctx.config.installer);

    // Dry runs never append, so they get a throwaway trail
    std::unique_ptr<AuditTrail> scratch;
    AuditTrail* audit = ctx.audit.get();
    if (!audit) {
        scratch = AuditTrail::inMemory();
        audit = scratch.get();
    }

    Gateway gateway(ctx.registry, validator, router, *audit, gw_opts);

    std::vector<GatewayOutcome> outcomes;
    if (install_opts.dry_run) {
        for (const auto& name : install_opts.names) {
            outcomes.push_back(gateway.evaluate(name));
        }
    } else {
        outcomes = gateway.installMany(install_opts.names);
    }

    int exit_code = 0;
    for (const auto& outcome : outcomes) {
        if (exit_code == 0) exit_code = outcome.exit_code();
    }

    if (opts.json) {
        nlohmann::json result;
        result["ok"] = exit_code == 0;
        result["dry_run"] = install_opts.dry_run;
        result["outcomes"] = nlohmann::json::array();
        for (const auto& outcome : outcomes) {
            result["outcomes"].push_back(outcome_to_json(outcome));
        }
        output_json(result);
        return exit_code;
    }

    for (const auto& outcome : outcomes) {
        print_outcome(outcome, install_opts.dry_run);
    }
    return exit_code;
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;

    app->add_option("names", install_opts.names, "Package names")->required();
    app->add_option("--min-trust", install_opts.min_trust, "Override policy.min_trust");
    app->add_flag("--no-intent", install_opts.no_intent, "Skip the intent check");
    app->add_flag("--deny-flagged", install_opts.deny_flagged,
                  "Deny packages the intent check flags");
    app->add_flag("--dry-run", install_opts.dry_run, "Evaluate policy only");

    app->callback([&opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace kit::cli::commands
