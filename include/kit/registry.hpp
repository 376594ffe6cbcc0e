#pragma once

/**
 * @file registry.hpp
 * @brief Immutable package catalogue and its atomically swapped holder
 *
 * A Registry is built once from registry JSON and never mutated. Refreshing
 * the catalogue means building a new Registry and handing it to
 * RegistryStore::replace(); readers holding an older snapshot keep using it.
 */

#include "kit/http.hpp"
#include "kit/result.hpp"
#include "kit/types.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace kit {

// ============================================================================
// Registry
// ============================================================================

class Registry {
public:
    Registry() = default;

    /// Build from records in insertion order. Duplicate names (after case
    /// normalization) and out-of-range trust scores are skipped and reported
    /// through `warnings`.
    static Registry fromRecords(std::vector<PackageRecord> records,
                                std::vector<std::string>* warnings = nullptr);

    /// Exact, case-normalized name lookup
    Result<PackageRecord> lookup(const std::string& name) const;

    /// Case-insensitive substring match on name and description, in
    /// insertion order. Never fails; empty when nothing matches.
    std::vector<PackageRecord> search(const std::string& keyword) const;

    /// All records in insertion order
    const std::vector<PackageRecord>& listAll() const { return records_; }

    bool contains(const std::string& name) const;
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    /// Where this snapshot was loaded from (file path, URL, or empty)
    const std::string& source() const { return source_; }
    void setSource(std::string source) { source_ = std::move(source); }

private:
    std::vector<PackageRecord> records_;
    std::unordered_map<std::string, size_t> index_;  // lowercase name -> position
    std::string source_;
};

// Lowercase a package name the way registry lookups do
std::string normalize_package_name(const std::string& name);

// ============================================================================
// Registry JSON Parsing
// ============================================================================

struct RegistryParseResult {
    bool ok = false;
    std::string error;
    Registry registry;
    std::vector<std::string> warnings;
};

// Parse a registry document: {"packages": {name: {...}}} or {"packages": [...]}
RegistryParseResult parse_registry(const std::string& json_str,
                                   const std::string& source = "");

// ============================================================================
// Registry Store
// ============================================================================

using RegistrySnapshot = std::shared_ptr<const Registry>;

class RegistryStore {
public:
    RegistryStore();
    explicit RegistryStore(Registry registry);

    /// Current snapshot; lock-free
    RegistrySnapshot snapshot() const;

    /// Swap in a new snapshot atomically
    void replace(Registry registry);

private:
    RegistrySnapshot current_;
};

// ============================================================================
// Registry Sourcing
// ============================================================================

struct RegistrySourceOptions {
    std::string cache_path;    // e.g. ~/.kit/packages.json
    std::string bundled_path;  // shipped default registry
    std::string url;           // remote registry
    long timeout_ms = 10000;
    HttpTransport transport;   // defaults to libcurl when empty
};

struct RegistryLoadResult {
    Registry registry;
    std::string origin;  // "cache" | "bundled" | "remote" | "none"
    std::vector<std::string> warnings;
};

// Load from cache, then bundled file, then remote URL; first that parses wins.
// When none loads, returns an empty registry with origin "none" and a warning.
RegistryLoadResult load_registry(const RegistrySourceOptions& options);

// Download the remote registry, validate it, and write it to the cache path
// atomically. On failure the cache is left untouched.
Result<Registry> update_registry(const RegistrySourceOptions& options);

} // namespace kit
