/**
 * kit CLI - Common utilities and types
 */

#pragma once

#include <kit/audit.hpp>
#include <kit/config.hpp>
#include <kit/platform.hpp>
#include <kit/registry.hpp>
#include <kit/result.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace kit::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline std::string dump_json(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << dump_json(j) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << dump_json(output) << std::endl;
    } else {
        std::cout << dump_json(j) << std::endl;
    }
}

/**
 * Logging: a colored stderr logger named "kit" becomes the spdlog default.
 * -v forces debug, -q forces error, otherwise the configured level applies.
 */
inline void init_logging() {
    auto logger = spdlog::stderr_color_mt("kit");
    logger->set_pattern("[%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::warn);
}

inline void apply_log_level(const GlobalOptions& opts, const std::string& configured) {
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::from_str(configured));
    }
}

/**
 * Everything a command needs, built from the resolved root and config.
 */
struct KitContext {
    std::string root;
    KitConfig config;
    RegistryStore registry;
    std::string registry_origin;
    std::unique_ptr<AuditTrail> audit;  // only when requested
};

inline Result<KitConfig> load_config(const GlobalOptions& opts) {
    std::string root = resolve_kit_root(opts.root);
    std::vector<std::string> warnings;
    auto config = load_kit_config(root, opts.config, warnings);
    for (const auto& w : warnings) print_warning(w);
    if (config.isOk()) {
        apply_log_level(opts, config.value().log_level);
        spdlog::debug("kit root: {}", root);
    }
    return config;
}

inline Result<KitContext> load_context(const GlobalOptions& opts, bool open_audit) {
    auto config = load_config(opts);
    if (config.isErr()) {
        return Result<KitContext>::err(config.error());
    }

    KitContext ctx;
    ctx.config = config.value();
    ctx.root = ctx.config.root;

    auto loaded = load_registry(registry_source_options(ctx.config));
    for (const auto& w : loaded.warnings) print_warning(w);
    ctx.registry_origin = loaded.origin;
    ctx.registry.replace(std::move(loaded.registry));

    if (open_audit) {
        std::string dir = get_parent_directory(ctx.config.audit.path);
        if (!dir.empty() && !path_exists(dir) && !create_directories(dir)) {
            return Result<KitContext>::err(
                Error(ErrorCode::IO_ERROR, "cannot create directory").withContext(dir));
        }
        auto trail = AuditTrail::open(ctx.config.audit.path);
        if (trail.isErr()) {
            return Result<KitContext>::err(trail.error());
        }
        ctx.audit = std::move(trail.value());
    }

    return Result<KitContext>::ok(std::move(ctx));
}

} // namespace kit::cli
