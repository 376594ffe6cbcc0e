/**
 * kit CLI - doctor command
 *
 * Check that the installers resolve on PATH, a registry is available,
 * the intent and registry endpoints answer, and the audit chain verifies.
 */

#include "../common.hpp"
#include <kit/http.hpp>
#include <kit/installer.hpp>
#include <CLI/CLI.hpp>

namespace kit::cli::commands {

namespace {

struct Check {
    std::string name;
    bool ok = false;
    bool required = true;
    std::string detail;
};

int cmd_doctor(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto loaded = load_context(opts, false);
    if (loaded.isErr()) {
        print_error(loaded.error().toString(), opts.json);
        return 1;
    }
    const KitContext& ctx = loaded.value();
    std::vector<Check> checks;

    for (auto ecosystem : {Ecosystem::Pip, Ecosystem::Npm}) {
        std::string exe = installer_executable(ecosystem, ctx.config.installer);
        auto found = find_executable(exe);
        Check check;
        check.name = std::string("installer:") + ecosystem_to_string(ecosystem);
        check.ok = found.has_value();
        check.required = false;
        check.detail = found ? *found : exe + " not found on PATH";
        checks.push_back(check);
    }

    {
        auto registry = ctx.registry.snapshot();
        Check check;
        check.name = "registry";
        check.ok = !registry->empty();
        check.detail = std::to_string(registry->size()) + " packages (" + ctx.registry_origin + ")";
        checks.push_back(check);
    }

    auto transport = default_http_transport();
    long probe_timeout = ctx.config.registry.timeout_ms;

    {
        Check check;
        check.name = "intent";
        check.required = false;
        if (ctx.config.intent.endpoint.empty() || !ctx.config.intent.enabled) {
            check.detail = "disabled";
        } else {
            auto probe = probe_endpoint(url_origin(ctx.config.intent.endpoint), probe_timeout,
                                        transport);
            check.ok = probe.up();
            check.detail = probe.describe() + " " + probe.url;
        }
        checks.push_back(check);
    }

    if (!ctx.config.registry.url.empty()) {
        Check check;
        check.name = "registry:remote";
        check.required = false;
        auto probe = probe_endpoint(ctx.config.registry.url, probe_timeout, transport);
        check.ok = probe.up();
        check.detail = probe.describe() + " " + probe.url;
        checks.push_back(check);
    }

    {
        Check check;
        check.name = "audit";
        auto trail = AuditTrail::open(ctx.config.audit.path);
        if (trail.isErr()) {
            check.detail = trail.error().message();
        } else {
            auto verification = trail.value()->verifyChain();
            check.ok = verification.ok;
            check.detail = verification.ok
                               ? std::to_string(verification.checked) + " records verified"
                               : verification.error;
        }
        checks.push_back(check);
    }

    bool healthy = true;
    for (const auto& check : checks) {
        if (check.required && !check.ok) healthy = false;
    }

    if (opts.json) {
        nlohmann::json result;
        result["ok"] = healthy;
        result["root"] = ctx.root;
        result["checks"] = nlohmann::json::array();
        for (const auto& check : checks) {
            result["checks"].push_back({{"name", check.name},
                                        {"ok", check.ok},
                                        {"required", check.required},
                                        {"detail", check.detail}});
        }
        output_json(result);
        return healthy ? 0 : 1;
    }

    std::cout << "kit root: " << ctx.root << std::endl;
    for (const auto& check : checks) {
        const char* mark = check.ok ? "ok  " : (check.required ? "FAIL" : "warn");
        std::cout << "  [" << mark << "] " << check.name << ": " << check.detail << std::endl;
    }
    std::cout << (healthy ? "All checks passed." : "Some checks failed.") << std::endl;
    return healthy ? 0 : 1;
}

} // anonymous namespace

void setup_doctor(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_doctor(opts));
    });
}

} // namespace kit::cli::commands
