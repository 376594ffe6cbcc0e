/**
 * kit CLI - update command
 *
 * Download the remote registry and replace the local cache.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace kit::cli::commands {

namespace {

int cmd_update(const GlobalOptions& opts, const std::string& url) {
    init_warning_collector(opts.json, opts.quiet);

    auto config = load_config(opts);
    if (config.isErr()) {
        print_error(config.error().toString(), opts.json);
        return 1;
    }

    auto source = registry_source_options(config.value());
    if (!url.empty()) source.url = url;

    std::string dir = get_parent_directory(source.cache_path);
    if (!dir.empty() && !path_exists(dir) && !create_directories(dir)) {
        print_error("cannot create directory: " + dir, opts.json);
        return 1;
    }

    auto updated = update_registry(source);
    if (updated.isErr()) {
        print_error(updated.error().toString(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json result;
        result["ok"] = true;
        result["url"] = source.url;
        result["cache_path"] = source.cache_path;
        result["packages"] = updated.value().size();
        output_json(result);
    } else {
        std::cout << "Registry updated: " << updated.value().size() << " packages -> "
                  << source.cache_path << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_update(CLI::App* app, GlobalOptions& opts) {
    static std::string url;

    app->add_option("--url", url, "Registry URL (default: registry.url)");

    app->callback([&opts]() {
        std::exit(cmd_update(opts, url));
    });
}

} // namespace kit::cli::commands
