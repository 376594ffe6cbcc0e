/**
 * kit CLI - search command
 */

#include "../common.hpp"
#include <kit/policy.hpp>
#include <kit/serialize.hpp>
#include <CLI/CLI.hpp>

namespace kit::cli::commands {

namespace {

int cmd_search(const GlobalOptions& opts, const std::string& keyword) {
    init_warning_collector(opts.json, opts.quiet);

    auto ctx = load_context(opts, false);
    if (ctx.isErr()) {
        print_error(ctx.error().toString(), opts.json);
        return 1;
    }

    auto matches = ctx.value().registry.snapshot()->search(keyword);

    if (opts.json) {
        nlohmann::json result;
        result["query"] = keyword;
        result["packages"] = nlohmann::json::array();
        for (const auto& record : matches) {
            result["packages"].push_back(package_record_to_json(record));
        }
        output_json(result);
        return 0;
    }

    if (matches.empty()) {
        std::cout << "No packages found for '" << keyword << "'" << std::endl;
        return 0;
    }

    for (const auto& record : matches) {
        std::cout << record.name << " " << record.version << std::endl;
        if (!record.description.empty()) {
            std::cout << "    " << record.description << std::endl;
        }
        std::cout << "    trust " << format_score(record.trust_score)
                  << " | " << (record.ecosystem.empty() ? "-" : record.ecosystem)
                  << ": " << record.target << std::endl;
    }
    std::cout << matches.size() << " package(s)" << std::endl;
    return 0;
}

} // anonymous namespace

void setup_search(CLI::App* app, GlobalOptions& opts) {
    static std::string keyword;

    app->add_option("keyword", keyword, "Substring of name or description")->required();

    app->callback([&opts]() {
        std::exit(cmd_search(opts, keyword));
    });
}

} // namespace kit::cli::commands
