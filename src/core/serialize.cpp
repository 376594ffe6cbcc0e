#include "kit/serialize.hpp"

namespace kit {

namespace {

using json = nlohmann::json;

std::string get_string(const json& j, const std::string& key, const std::string& default_val = "") {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return default_val;
}

std::vector<std::string> get_string_array(const json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

// Optional boolean field; false when absent, error when present with another type
bool read_optional_bool(const json& j, const std::string& key, bool& out) {
    if (!j.contains(key) || j[key].is_null()) {
        out = false;
        return true;
    }
    if (!j[key].is_boolean()) return false;
    out = j[key].get<bool>();
    return true;
}

json audit_record_body(const AuditRecord& record) {
    json j;
    j["sequence"] = record.sequence;
    j["timestamp"] = record.timestamp;
    j["package"] = record.package;
    j["actor"] = record.actor;
    j["outcome"] = outcome_status_to_string(record.outcome);
    j["abort_reason"] = record.abort_reason ? json(*record.abort_reason) : json(nullptr);
    j["decision"] = record.decision ? policy_decision_to_json(*record.decision) : json(nullptr);
    j["install"] = record.install ? install_result_to_json(*record.install) : json(nullptr);
    j["prev_hash"] = record.prev_hash;
    return j;
}

} // namespace

std::string dump_compact(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json package_record_to_json(const PackageRecord& record) {
    json j;
    j["name"] = record.name;
    j["version"] = record.version;
    j["description"] = record.description;
    j["author"] = record.author;
    j["ecosystem"] = record.ecosystem;
    j["target"] = record.target;
    j["jis_compliant"] = record.compliant;
    j["snaft_verified"] = record.verified;
    j["trust_score"] = record.trust_score;
    j["dependencies"] = record.dependencies;
    if (record.mcp_command) {
        j["mcp_config"]["command"] = *record.mcp_command;
    }
    return j;
}

json intent_result_to_json(const IntentCheckResult& intent) {
    json j;
    j["status"] = intent_status_to_string(intent.status);
    j["checked"] = intent.checked();
    j["flagged"] = intent.flagged();
    j["rationale"] = intent.rationale;
    return j;
}

json policy_decision_to_json(const PolicyDecision& decision) {
    json j;
    j["package"] = decision.package;
    j["verdict"] = decision.verdict;
    j["min_trust"] = decision.min_trust;
    j["reasons"] = decision.reasons;
    j["intent"] = decision.intent ? intent_result_to_json(*decision.intent) : json(nullptr);
    return j;
}

json install_result_to_json(const InstallResult& result) {
    json j;
    j["package"] = result.package;
    j["installer"] = result.installer;
    j["command"] = result.command;
    j["exit_code"] = result.exit_code;
    j["output"] = result.output;
    j["success"] = result.success;
    j["timed_out"] = result.timed_out;
    j["timestamp"] = result.timestamp;
    return j;
}

json audit_record_to_json(const AuditRecord& record) {
    json j = audit_record_body(record);
    j["hash"] = record.hash;
    return j;
}

std::string audit_record_canonical(const AuditRecord& record) {
    // nlohmann::json keeps object keys sorted, so the dump is deterministic
    return dump_compact(audit_record_body(record));
}

ParseResult<PolicyDecision> parse_policy_decision(const json& j) {
    ParseResult<PolicyDecision> result;
    if (!j.is_object()) {
        result.error = "decision must be an object";
        return result;
    }
    if (!j.contains("verdict") || !j["verdict"].is_boolean()) {
        result.error = "decision.verdict missing";
        return result;
    }
    if (!j.contains("min_trust") || !j["min_trust"].is_number()) {
        result.error = "decision.min_trust missing";
        return result;
    }

    result.value.package = get_string(j, "package");
    result.value.verdict = j["verdict"].get<bool>();
    result.value.min_trust = j["min_trust"].get<double>();
    result.value.reasons = get_string_array(j, "reasons");

    if (j.contains("intent") && j["intent"].is_object()) {
        const auto& intent = j["intent"];
        IntentCheckResult ir;
        auto status = parse_intent_status(get_string(intent, "status", "unchecked"));
        if (!status) {
            result.error = "decision.intent.status invalid";
            return result;
        }
        ir.status = *status;
        ir.rationale = get_string(intent, "rationale");
        result.value.intent = ir;
    }

    result.ok = true;
    return result;
}

ParseResult<InstallResult> parse_install_result(const json& j) {
    ParseResult<InstallResult> result;
    if (!j.is_object()) {
        result.error = "install must be an object";
        return result;
    }
    if (!j.contains("exit_code") || !j["exit_code"].is_number_integer()) {
        result.error = "install.exit_code missing";
        return result;
    }

    result.value.package = get_string(j, "package");
    result.value.installer = get_string(j, "installer");
    result.value.command = get_string_array(j, "command");
    result.value.exit_code = j["exit_code"].get<int>();
    result.value.output = get_string(j, "output");
    if (!read_optional_bool(j, "success", result.value.success)) {
        result.error = "install.success must be a boolean";
        return result;
    }
    if (!read_optional_bool(j, "timed_out", result.value.timed_out)) {
        result.error = "install.timed_out must be a boolean";
        return result;
    }
    result.value.timestamp = get_string(j, "timestamp");
    result.ok = true;
    return result;
}

ParseResult<AuditRecord> parse_audit_record(const std::string& line) {
    ParseResult<AuditRecord> result;

    json j;
    try {
        j = json::parse(line);
    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "audit record must be an object";
        return result;
    }
    if (!j.contains("sequence") || !j["sequence"].is_number_unsigned()) {
        result.error = "sequence missing";
        return result;
    }

    auto& rec = result.value;
    rec.sequence = j["sequence"].get<uint64_t>();
    rec.timestamp = get_string(j, "timestamp");
    rec.package = get_string(j, "package");
    rec.actor = get_string(j, "actor");

    auto outcome = parse_outcome_status(get_string(j, "outcome"));
    if (!outcome) {
        result.error = "outcome invalid";
        return result;
    }
    rec.outcome = *outcome;

    if (j.contains("abort_reason") && j["abort_reason"].is_string()) {
        rec.abort_reason = j["abort_reason"].get<std::string>();
    }

    if (j.contains("decision") && !j["decision"].is_null()) {
        auto decision = parse_policy_decision(j["decision"]);
        if (!decision.ok) {
            result.error = decision.error;
            return result;
        }
        rec.decision = std::move(decision.value);
    }

    if (j.contains("install") && !j["install"].is_null()) {
        auto install = parse_install_result(j["install"]);
        if (!install.ok) {
            result.error = install.error;
            return result;
        }
        rec.install = std::move(install.value);
    }

    rec.prev_hash = get_string(j, "prev_hash");
    rec.hash = get_string(j, "hash");
    if (rec.hash.empty()) {
        result.error = "hash missing";
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace kit
