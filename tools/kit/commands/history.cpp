/**
 * kit CLI - history command
 *
 * Print audit records oldest first, optionally filtered, and optionally
 * verify the hash chain.
 */

#include "../common.hpp"
#include <kit/serialize.hpp>
#include <CLI/CLI.hpp>

namespace kit::cli::commands {

namespace {

struct HistoryOptions {
    std::string package;
    std::string outcome;
    uint64_t since = 0;
    bool verify = false;
};

int cmd_history(const GlobalOptions& opts, const HistoryOptions& history_opts) {
    init_warning_collector(opts.json, opts.quiet);

    AuditFilter filter;
    if (!history_opts.package.empty()) filter.package = history_opts.package;
    if (!history_opts.outcome.empty()) {
        auto outcome = parse_outcome_status(history_opts.outcome);
        if (!outcome) {
            print_error("unknown outcome: " + history_opts.outcome, opts.json);
            return 1;
        }
        filter.outcome = *outcome;
    }
    filter.since_sequence = history_opts.since;

    auto config = load_config(opts);
    if (config.isErr()) {
        print_error(config.error().toString(), opts.json);
        return 1;
    }

    auto trail = AuditTrail::open(config.value().audit.path);
    if (trail.isErr()) {
        print_error(trail.error().toString(), opts.json);
        return 1;
    }

    auto history = trail.value()->history(filter);

    std::optional<ChainVerification> verification;
    if (history_opts.verify) {
        verification = trail.value()->verifyChain();
    }
    int exit_code = (verification && !verification->ok) ? 1 : 0;

    if (opts.json) {
        nlohmann::json result;
        result["records"] = nlohmann::json::array();
        for (const auto& record : history) {
            result["records"].push_back(audit_record_to_json(record));
        }
        if (verification) {
            result["chain"] = {{"ok", verification->ok},
                               {"checked", verification->checked},
                               {"error", verification->error}};
        }
        output_json(result);
        return exit_code;
    }

    for (const auto& record : history) {
        std::cout << "#" << record.sequence << " " << record.timestamp << " "
                  << record.package << " " << outcome_status_to_string(record.outcome)
                  << " (" << record.actor << ")";
        if (record.abort_reason) {
            std::cout << ": " << *record.abort_reason;
        } else if (record.decision && !record.decision->reasons.empty()) {
            std::cout << ": " << record.decision->reasons.front();
        }
        std::cout << std::endl;
    }
    if (history.empty()) {
        std::cout << "No audit records." << std::endl;
    }

    if (verification) {
        if (verification->ok) {
            std::cout << "Chain verified: " << verification->checked << " records" << std::endl;
        } else {
            std::cerr << "Chain BROKEN: " << verification->error << std::endl;
        }
    }
    return exit_code;
}

} // anonymous namespace

void setup_history(CLI::App* app, GlobalOptions& opts) {
    static HistoryOptions history_opts;

    app->add_option("--package", history_opts.package, "Only records for this package");
    app->add_option("--outcome", history_opts.outcome,
                    "Only this outcome (installed, not_found, policy_denied, ...)");
    app->add_option("--since", history_opts.since, "Only records with sequence >= N");
    app->add_flag("--verify", history_opts.verify, "Verify the hash chain");

    app->callback([&opts]() {
        std::exit(cmd_history(opts, history_opts));
    });
}

} // namespace kit::cli::commands
