/**
 * kit CLI - list command
 *
 * List every package in the loaded registry with its policy inputs and
 * whether the backend reports it as installed.
 */

#include "../common.hpp"
#include <kit/installer.hpp>
#include <kit/policy.hpp>
#include <kit/serialize.hpp>
#include <CLI/CLI.hpp>

#include <iomanip>

namespace kit::cli::commands {

namespace {

struct ListOptions {
    bool allowed = false;
};

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto ctx = load_context(opts, false);
    if (ctx.isErr()) {
        print_error(ctx.error().toString(), opts.json);
        return 1;
    }

    auto registry = ctx.value().registry.snapshot();
    double min_trust = ctx.value().config.min_trust;

    nlohmann::json result;
    result["origin"] = ctx.value().registry_origin;
    result["min_trust"] = min_trust;
    result["packages"] = nlohmann::json::array();

    InstallerRouter router(ctx.value().config.installer);
    for (const auto& record : registry->listAll()) {
        auto decision = evaluate_policy(record, min_trust);
        if (list_opts.allowed && !decision.verdict) continue;

        auto entry = package_record_to_json(record);
        entry["allowed"] = decision.verdict;
        auto installed = router.isInstalled(record);
        if (installed.isOk()) {
            entry["installed"] = installed.value();
        } else {
            entry["installed"] = nullptr;
            spdlog::debug("installed status of {} unknown: {}", record.name,
                          installed.error().message());
        }
        result["packages"].push_back(entry);
    }

    if (opts.json) {
        output_json(result);
        return 0;
    }

    if (result["packages"].empty()) {
        std::cout << "No packages in registry (" << ctx.value().registry_origin << ")." << std::endl;
        return 0;
    }

    std::cout << "Packages (" << ctx.value().registry_origin << ", min trust "
              << format_score(min_trust) << "):" << std::endl;
    for (const auto& pkg : result["packages"]) {
        const char* status = pkg["installed"].is_null()
                                 ? "unknown"
                                 : (pkg["installed"].get<bool>() ? "installed" : "available");
        std::cout << "  " << std::left << std::setw(28)
                  << (pkg["name"].get<std::string>() + "@" + pkg["version"].get<std::string>())
                  << std::setw(6) << pkg["ecosystem"].get<std::string>()
                  << " trust " << std::setw(5) << format_score(pkg["trust_score"].get<double>())
                  << " " << std::setw(10) << status
                  << (pkg["allowed"].get<bool>() ? "" : "  [blocked]") << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_flag("--allowed", list_opts.allowed, "Only packages that pass policy");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace kit::cli::commands
