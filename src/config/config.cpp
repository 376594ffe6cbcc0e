#include "kit/config.hpp"
#include "kit/platform.hpp"
#include "kit/policy.hpp"

#include <cstdint>
#include <cstdlib>
#include <map>
#include <set>

#include <nlohmann/json.hpp>

#ifndef KIT_BUNDLED_REGISTRY
#define KIT_BUNDLED_REGISTRY ""
#endif

namespace kit {

namespace {

using json = nlohmann::json;

// Thrown inside the parser and turned into KitConfigParseResult::error
struct ConfigValueError {
    std::string message;
};

const std::set<std::string>& known_keys(const std::string& section) {
    static const std::map<std::string, std::set<std::string>> keys = {
        {"", {"$schema", "policy", "intent", "installer", "registry", "audit", "logging"}},
        {"policy", {"min_trust"}},
        {"intent", {"endpoint", "model", "timeout_ms", "enabled", "deny_on_flagged"}},
        {"installer", {"python", "npm", "timeout_s"}},
        {"registry", {"url", "cache_path", "bundled_path", "timeout_s"}},
        {"audit", {"path", "actor"}},
        {"logging", {"level"}},
    };
    static const std::set<std::string> none;
    auto it = keys.find(section);
    return it == keys.end() ? none : it->second;
}

void warn_unknown_keys(const json& obj, const std::string& section,
                       std::vector<std::string>& warnings) {
    const auto& allowed = known_keys(section);
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (allowed.count(it.key()) == 0) {
            std::string key = section.empty() ? it.key() : section + "." + it.key();
            warnings.push_back("unknown config key: " + key);
        }
    }
}

const json* section_of(const json& j, const std::string& name) {
    if (!j.contains(name)) return nullptr;
    if (!j[name].is_object()) {
        throw ConfigValueError{name + " must be an object"};
    }
    return &j[name];
}

void read_string(const json& obj, const std::string& section, const std::string& key,
                 std::string& out) {
    if (!obj.contains(key)) return;
    if (!obj[key].is_string()) {
        throw ConfigValueError{section + "." + key + " must be a string"};
    }
    out = obj[key].get<std::string>();
}

void read_bool(const json& obj, const std::string& section, const std::string& key, bool& out) {
    if (!obj.contains(key)) return;
    if (!obj[key].is_boolean()) {
        throw ConfigValueError{section + "." + key + " must be a boolean"};
    }
    out = obj[key].get<bool>();
}

constexpr long MAX_TIMEOUT_MS = 24L * 60 * 60 * 1000;

// Timeout given in units of `unit_ms`; returns milliseconds, at most one day
long read_timeout(const json& obj, const std::string& section, const std::string& key,
                  long unit_ms, long current_ms) {
    if (!obj.contains(key)) return current_ms;
    const json& v = obj[key];
    const long max_units = MAX_TIMEOUT_MS / unit_ms;
    bool in_range = false;
    if (v.is_number_unsigned()) {
        auto n = v.get<uint64_t>();
        in_range = n > 0 && n <= static_cast<uint64_t>(max_units);
    } else if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        in_range = n > 0 && n <= max_units;
    }
    if (!in_range) {
        throw ConfigValueError{section + "." + key + " must be an integer in [1, " +
                               std::to_string(max_units) + "]"};
    }
    return static_cast<long>(v.get<int64_t>()) * unit_ms;
}

std::string resolve_against(const std::string& root, const std::string& path) {
    if (path.empty() || path[0] == '/') return path;
    return join_path(root, path);
}

std::optional<double> parse_threshold(const std::string& text) {
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end == nullptr || *end != '\0' || !is_valid_threshold(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace

bool is_valid_log_level(const std::string& level) {
    static const std::set<std::string> levels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    return levels.count(level) > 0;
}

KitConfig get_builtin_config(const std::string& root) {
    KitConfig config;
    config.root = root;
    config.registry.cache_path = join_path(root, "packages.json");
    config.registry.bundled_path = KIT_BUNDLED_REGISTRY;
    config.audit.path = join_path(root, "audit.ndjson");
    config.audit.actor = get_env("USER").value_or("unknown");
    if (config.audit.actor.empty()) config.audit.actor = "unknown";
    return config;
}

KitConfigParseResult parse_kit_config_full(const std::string& json_str,
                                           const std::string& root,
                                           const std::string& source_path) {
    KitConfigParseResult result;
    result.config = get_builtin_config(root);
    result.config.source_path = source_path;
    auto& cfg = result.config;

    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "JSON must be an object";
        return result;
    }

    try {
        if (j.contains("$schema")) {
            std::string schema;
            read_string(j, "", "$schema", schema);
            if (schema != CONFIG_SCHEMA) {
                result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
                return result;
            }
        }
        warn_unknown_keys(j, "", result.warnings);

        if (const json* policy = section_of(j, "policy")) {
            warn_unknown_keys(*policy, "policy", result.warnings);
            if (policy->contains("min_trust")) {
                const auto& v = (*policy)["min_trust"];
                if (!v.is_number() || !is_valid_threshold(v.get<double>())) {
                    throw ConfigValueError{"policy.min_trust must be a number in [0, 1]"};
                }
                cfg.min_trust = v.get<double>();
            }
        }

        if (const json* intent = section_of(j, "intent")) {
            warn_unknown_keys(*intent, "intent", result.warnings);
            read_string(*intent, "intent", "endpoint", cfg.intent.endpoint);
            read_string(*intent, "intent", "model", cfg.intent.model);
            cfg.intent.timeout_ms = read_timeout(*intent, "intent", "timeout_ms", 1,
                                                 cfg.intent.timeout_ms);
            read_bool(*intent, "intent", "enabled", cfg.intent.enabled);
            read_bool(*intent, "intent", "deny_on_flagged", cfg.intent.deny_on_flagged);
        }

        if (const json* installer = section_of(j, "installer")) {
            warn_unknown_keys(*installer, "installer", result.warnings);
            read_string(*installer, "installer", "python", cfg.installer.python);
            read_string(*installer, "installer", "npm", cfg.installer.npm);
            cfg.installer.timeout_ms = read_timeout(*installer, "installer", "timeout_s", 1000,
                                                    cfg.installer.timeout_ms);
        }

        if (const json* registry = section_of(j, "registry")) {
            warn_unknown_keys(*registry, "registry", result.warnings);
            read_string(*registry, "registry", "url", cfg.registry.url);
            read_string(*registry, "registry", "cache_path", cfg.registry.cache_path);
            read_string(*registry, "registry", "bundled_path", cfg.registry.bundled_path);
            cfg.registry.timeout_ms = read_timeout(*registry, "registry", "timeout_s", 1000,
                                                   cfg.registry.timeout_ms);
            cfg.registry.cache_path = resolve_against(root, cfg.registry.cache_path);
            cfg.registry.bundled_path = resolve_against(root, cfg.registry.bundled_path);
        }

        if (const json* audit = section_of(j, "audit")) {
            warn_unknown_keys(*audit, "audit", result.warnings);
            read_string(*audit, "audit", "path", cfg.audit.path);
            read_string(*audit, "audit", "actor", cfg.audit.actor);
            cfg.audit.path = resolve_against(root, cfg.audit.path);
        }

        if (const json* logging = section_of(j, "logging")) {
            warn_unknown_keys(*logging, "logging", result.warnings);
            read_string(*logging, "logging", "level", cfg.log_level);
            if (!is_valid_log_level(cfg.log_level)) {
                throw ConfigValueError{"logging.level invalid: " + cfg.log_level};
            }
        }
    } catch (const ConfigValueError& e) {
        result.error = e.message;
        return result;
    }

    result.ok = true;
    return result;
}

void apply_env_overrides(KitConfig& config, std::vector<std::string>& warnings) {
    if (auto endpoint = get_env("KIT_INTENT_ENDPOINT")) {
        config.intent.endpoint = *endpoint;
    }

    if (auto min_trust = get_env("KIT_MIN_TRUST")) {
        if (auto value = parse_threshold(*min_trust)) {
            config.min_trust = *value;
        } else {
            warnings.push_back("ignoring KIT_MIN_TRUST: not a number in [0, 1]: " + *min_trust);
        }
    }

    if (auto level = get_env("KIT_LOG_LEVEL")) {
        if (is_valid_log_level(*level)) {
            config.log_level = *level;
        } else {
            warnings.push_back("ignoring KIT_LOG_LEVEL: unknown level " + *level);
        }
    }
}

Result<KitConfig> load_kit_config(const std::string& root,
                                  const std::string& explicit_path,
                                  std::vector<std::string>& warnings) {
    std::string path = explicit_path.empty() ? join_path(root, CONFIG_FILENAME) : explicit_path;

    KitConfig config;
    if (!path_exists(path)) {
        if (!explicit_path.empty()) {
            return Result<KitConfig>::err(
                Error(ErrorCode::IO_ERROR, "config file not found").withContext(path));
        }
        config = get_builtin_config(root);
    } else {
        auto content = read_file(path);
        if (!content) {
            return Result<KitConfig>::err(
                Error(ErrorCode::IO_ERROR, "cannot read config").withContext(path));
        }
        auto parsed = parse_kit_config_full(*content, root, path);
        if (!parsed.ok) {
            return Result<KitConfig>::err(
                Error(ErrorCode::CONFIG_INVALID, parsed.error).withContext(path));
        }
        for (auto& w : parsed.warnings) warnings.push_back(std::move(w));
        config = std::move(parsed.config);
    }

    apply_env_overrides(config, warnings);
    return Result<KitConfig>::ok(std::move(config));
}

std::string resolve_kit_root(const std::string& flag_root) {
    if (!flag_root.empty()) {
        return flag_root;
    }
    if (auto env_root = get_env("KIT_ROOT")) {
        if (!env_root->empty()) return *env_root;
    }
    if (auto home = get_env("HOME")) {
        if (!home->empty()) return *home + "/.kit";
    }
    return ".kit";
}

RegistrySourceOptions registry_source_options(const KitConfig& config) {
    RegistrySourceOptions options;
    options.cache_path = config.registry.cache_path;
    options.bundled_path = config.registry.bundled_path;
    options.url = config.registry.url;
    options.timeout_ms = config.registry.timeout_ms;
    return options;
}

IntentValidatorOptions intent_validator_options(const KitConfig& config) {
    IntentValidatorOptions options;
    options.endpoint = config.intent.endpoint;
    options.model = config.intent.model;
    options.timeout_ms = config.intent.timeout_ms;
    return options;
}

} // namespace kit
