/**
 * kit CLI - Entry Point
 *
 * Policy-gated package installation.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace kit::cli::commands {
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_search(CLI::App* app, GlobalOptions& opts);
    void setup_info(CLI::App* app, GlobalOptions& opts);
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_doctor(CLI::App* app, GlobalOptions& opts);
    void setup_update(CLI::App* app, GlobalOptions& opts);
    void setup_history(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace kit::cli;

    CLI::App app{"kit - policy-gated package installer"};
    app.set_version_flag("-V,--version", KIT_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    app.add_option("--root", opts.root, "kit root directory (default: $KIT_ROOT or ~/.kit)");
    app.add_option("--config", opts.config, "Config file (default: <root>/kit.json)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* list_cmd = app.add_subcommand("list", "List registry packages");
    commands::setup_list(list_cmd, opts);

    auto* search_cmd = app.add_subcommand("search", "Search packages by keyword");
    commands::setup_search(search_cmd, opts);

    auto* info_cmd = app.add_subcommand("info", "Show package details and policy preview");
    commands::setup_info(info_cmd, opts);

    auto* install_cmd = app.add_subcommand("install", "Validate and install packages");
    commands::setup_install(install_cmd, opts);

    auto* doctor_cmd = app.add_subcommand("doctor", "Check installers, registry and audit log");
    commands::setup_doctor(doctor_cmd, opts);

    auto* update_cmd = app.add_subcommand("update", "Refresh the registry cache");
    commands::setup_update(update_cmd, opts);

    auto* history_cmd = app.add_subcommand("history", "Show the audit trail");
    commands::setup_history(history_cmd, opts);

    init_logging();

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
