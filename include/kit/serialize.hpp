#pragma once

#include "kit/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace kit {

// ============================================================================
// JSON Serialization
// ============================================================================

nlohmann::json package_record_to_json(const PackageRecord& record);

nlohmann::json intent_result_to_json(const IntentCheckResult& intent);

nlohmann::json policy_decision_to_json(const PolicyDecision& decision);

nlohmann::json install_result_to_json(const InstallResult& result);

// Full record including "hash"
nlohmann::json audit_record_to_json(const AuditRecord& record);

// Serialized form that gets hashed (no "hash" field), deterministic key order
std::string audit_record_canonical(const AuditRecord& record);

// Single-line JSON. Invalid UTF-8 in captured output is replaced, not rejected.
std::string dump_compact(const nlohmann::json& j);

// ============================================================================
// JSON Parsing
// ============================================================================

template<typename T>
struct ParseResult {
    bool ok = false;
    std::string error;
    T value;
};

ParseResult<PolicyDecision> parse_policy_decision(const nlohmann::json& j);

ParseResult<InstallResult> parse_install_result(const nlohmann::json& j);

ParseResult<AuditRecord> parse_audit_record(const std::string& line);

} // namespace kit
