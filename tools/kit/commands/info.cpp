/**
 * kit CLI - info command
 *
 * Show one package and how the current policy would decide on it.
 * Nothing is installed and nothing is audited.
 */

#include "../common.hpp"
#include <kit/policy.hpp>
#include <kit/serialize.hpp>
#include <CLI/CLI.hpp>

namespace kit::cli::commands {

namespace {

const char* yes_no(bool value) { return value ? "yes" : "no"; }

int cmd_info(const GlobalOptions& opts, const std::string& name) {
    init_warning_collector(opts.json, opts.quiet);

    auto ctx = load_context(opts, false);
    if (ctx.isErr()) {
        print_error(ctx.error().toString(), opts.json);
        return 1;
    }

    auto registry = ctx.value().registry.snapshot();
    auto found = registry->lookup(name);
    if (found.isErr()) {
        print_error("package not found: " + name, opts.json);
        return 2;
    }
    const PackageRecord& record = found.value();
    auto decision = evaluate_policy(record, ctx.value().config.min_trust);

    std::vector<std::string> missing;
    for (const auto& dep : record.dependencies) {
        if (!registry->contains(dep)) missing.push_back(dep);
    }

    if (opts.json) {
        nlohmann::json result;
        result["package"] = package_record_to_json(record);
        result["policy"] = policy_decision_to_json(decision);
        result["missing_dependencies"] = missing;
        output_json(result);
        return 0;
    }

    std::cout << record.name << " " << record.version << std::endl;
    std::cout << "  Description:  " << record.description << std::endl;
    std::cout << "  Author:       " << record.author << std::endl;
    std::cout << "  Installer:    " << (record.ecosystem.empty() ? "-" : record.ecosystem)
              << " (" << record.target << ")" << std::endl;
    std::cout << "  Trust score:  " << format_score(record.trust_score) << std::endl;
    std::cout << "  Compliant:    " << yes_no(record.compliant) << std::endl;
    std::cout << "  Verified:     " << yes_no(record.verified) << std::endl;

    if (!record.dependencies.empty()) {
        std::cout << "  Dependencies:";
        for (const auto& dep : record.dependencies) std::cout << " " << dep;
        std::cout << std::endl;
    }
    for (const auto& dep : missing) {
        print_warning("dependency not in registry: " + dep);
    }
    if (record.mcp_command) {
        std::cout << "  MCP command:  " << *record.mcp_command << std::endl;
    }

    std::cout << "  Policy:       " << (decision.verdict ? "allowed" : "blocked") << std::endl;
    for (const auto& reason : decision.reasons) {
        std::cout << "    - " << reason << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_info(CLI::App* app, GlobalOptions& opts) {
    static std::string name;

    app->add_option("name", name, "Package name")->required();

    app->callback([&opts]() {
        std::exit(cmd_info(opts, name));
    });
}

} // namespace kit::cli::commands
