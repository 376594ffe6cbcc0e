#include "kit/registry.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>

#include <nlohmann/json.hpp>

namespace kit {

namespace {

using ordered_json = nlohmann::ordered_json;

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const ordered_json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const ordered_json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

bool get_bool(const ordered_json& j, const std::string& key) {
    return j.contains(key) && j[key].is_boolean() && j[key].get<bool>();
}

PackageRecord parse_package_record(const ordered_json& j, const std::string& key_name,
                                   std::vector<std::string>& warnings) {
    PackageRecord rec;
    rec.name = trim(get_string(j, "name").value_or(key_name));
    if (auto v = get_string(j, "version")) rec.version = *v;
    if (auto v = get_string(j, "description")) rec.description = *v;
    if (auto v = get_string(j, "author")) rec.author = *v;

    rec.compliant = get_bool(j, "jis_compliant");
    rec.verified = get_bool(j, "snaft_verified");

    if (j.contains("trust_score")) {
        if (j["trust_score"].is_number()) {
            rec.trust_score = j["trust_score"].get<double>();
        } else {
            warnings.push_back(rec.name + ": trust_score is not a number, using 0");
        }
    }

    // Explicit ecosystem/target win; otherwise fall back to pypi/npm fields
    if (auto eco = get_string(j, "ecosystem")) {
        rec.ecosystem = to_lower(trim(*eco));
        rec.target = get_string(j, "target").value_or(rec.name);
    } else if (auto pypi = get_string(j, "pypi")) {
        rec.ecosystem = "pip";
        rec.target = *pypi;
    } else if (auto npm = get_string(j, "npm")) {
        rec.ecosystem = "npm";
        rec.target = *npm;
    } else {
        rec.target = get_string(j, "target").value_or(rec.name);
    }

    rec.dependencies = get_string_array(j, "dependencies");

    if (j.contains("mcp_config") && j["mcp_config"].is_object()) {
        rec.mcp_command = get_string(j["mcp_config"], "command");
    }

    return rec;
}

} // namespace

std::string normalize_package_name(const std::string& name) {
    return to_lower(trim(name));
}

// ============================================================================
// Registry
// ============================================================================

Registry Registry::fromRecords(std::vector<PackageRecord> records,
                               std::vector<std::string>* warnings) {
    Registry reg;
    reg.records_.reserve(records.size());

    for (auto& rec : records) {
        std::string key = normalize_package_name(rec.name);
        if (key.empty()) {
            if (warnings) warnings->push_back("skipping package with empty name");
            continue;
        }
        if (!std::isfinite(rec.trust_score) || rec.trust_score < 0.0 || rec.trust_score > 1.0) {
            if (warnings) {
                warnings->push_back(rec.name + ": trust_score out of range [0, 1], skipped");
            }
            continue;
        }
        if (reg.index_.count(key)) {
            if (warnings) warnings->push_back(rec.name + ": duplicate package name, skipped");
            continue;
        }
        reg.index_[key] = reg.records_.size();
        reg.records_.push_back(std::move(rec));
    }

    return reg;
}

Result<PackageRecord> Registry::lookup(const std::string& name) const {
    auto it = index_.find(normalize_package_name(name));
    if (it == index_.end()) {
        return Result<PackageRecord>::err(Error(ErrorCode::NOT_FOUND,
                                                "package not found: " + name));
    }
    return Result<PackageRecord>::ok(records_[it->second]);
}

std::vector<PackageRecord> Registry::search(const std::string& keyword) const {
    std::vector<PackageRecord> results;
    std::string query = to_lower(keyword);

    for (const auto& rec : records_) {
        if (to_lower(rec.name).find(query) != std::string::npos ||
            to_lower(rec.description).find(query) != std::string::npos) {
            results.push_back(rec);
        }
    }
    return results;
}

bool Registry::contains(const std::string& name) const {
    return index_.count(normalize_package_name(name)) > 0;
}

// ============================================================================
// Parsing
// ============================================================================

RegistryParseResult parse_registry(const std::string& json_str, const std::string& source) {
    RegistryParseResult result;

    try {
        auto j = ordered_json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (!j.contains("packages")) {
            result.error = "packages section missing";
            return result;
        }

        const auto& packages = j["packages"];
        std::vector<PackageRecord> records;

        if (packages.is_object()) {
            for (auto& [name, entry] : packages.items()) {
                if (!entry.is_object()) {
                    result.warnings.push_back(name + ": entry is not an object, skipped");
                    continue;
                }
                records.push_back(parse_package_record(entry, name, result.warnings));
            }
        } else if (packages.is_array()) {
            for (const auto& entry : packages) {
                if (!entry.is_object() || !get_string(entry, "name")) {
                    result.warnings.push_back("array entry without name, skipped");
                    continue;
                }
                records.push_back(parse_package_record(entry, "", result.warnings));
            }
        } else {
            result.error = "packages must be an object or an array";
            return result;
        }

        result.registry = Registry::fromRecords(std::move(records), &result.warnings);
        result.registry.setSource(source);
        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

// ============================================================================
// Registry Store
// ============================================================================

RegistryStore::RegistryStore() : current_(std::make_shared<const Registry>()) {}

RegistryStore::RegistryStore(Registry registry)
    : current_(std::make_shared<const Registry>(std::move(registry))) {}

RegistrySnapshot RegistryStore::snapshot() const {
    return std::atomic_load(&current_);
}

void RegistryStore::replace(Registry registry) {
    std::atomic_store(&current_, RegistrySnapshot(std::make_shared<const Registry>(std::move(registry))));
}

} // namespace kit
