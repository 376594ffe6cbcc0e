#pragma once

#include "kit/installer.hpp"
#include "kit/intent.hpp"
#include "kit/registry.hpp"
#include "kit/result.hpp"

#include <string>
#include <vector>

namespace kit {

constexpr const char* CONFIG_SCHEMA = "kit.config.v1";
constexpr const char* CONFIG_FILENAME = "kit.json";

// ============================================================================
// Configuration
// ============================================================================

struct IntentConfig {
    std::string endpoint;  // empty disables the check
    std::string model = "kit";
    long timeout_ms = 5000;
    bool enabled = true;
    bool deny_on_flagged = false;
};

struct RegistryConfig {
    std::string url;
    std::string cache_path;
    std::string bundled_path;
    long timeout_ms = 10000;
};

struct AuditConfig {
    std::string path;
    std::string actor;
};

struct KitConfig {
    std::string schema = CONFIG_SCHEMA;
    std::string root;
    std::string source_path;  // empty when built-in

    double min_trust = 0.5;
    IntentConfig intent;
    InstallerConfig installer;
    RegistryConfig registry;
    AuditConfig audit;
    std::string log_level = "warn";
};

struct KitConfigParseResult {
    bool ok = false;
    std::string error;
    KitConfig config;
    std::vector<std::string> warnings;
};

/// Defaults for a given root: cache, audit log and config live beneath it.
KitConfig get_builtin_config(const std::string& root);

/// Parse a kit.json document on top of the built-in defaults.
/// Unknown keys produce warnings; wrong types or out-of-range values fail.
KitConfigParseResult parse_kit_config_full(const std::string& json_str,
                                           const std::string& root,
                                           const std::string& source_path = "");

/// Apply KIT_INTENT_ENDPOINT, KIT_MIN_TRUST and KIT_LOG_LEVEL.
void apply_env_overrides(KitConfig& config, std::vector<std::string>& warnings);

/// Load <root>/kit.json (or `explicit_path`) and apply environment overrides.
/// A missing default file yields the built-in config; a missing explicit
/// file is an IO_ERROR.
Result<KitConfig> load_kit_config(const std::string& root,
                                  const std::string& explicit_path,
                                  std::vector<std::string>& warnings);

/// --root flag, else KIT_ROOT, else ~/.kit
std::string resolve_kit_root(const std::string& flag_root);

bool is_valid_log_level(const std::string& level);

RegistrySourceOptions registry_source_options(const KitConfig& config);
IntentValidatorOptions intent_validator_options(const KitConfig& config);

} // namespace kit
