#include "kit/audit.hpp"
#include "kit/platform.hpp"
#include "kit/registry.hpp"
#include "kit/serialize.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace kit {

// ============================================================================
// AuditFilter / AuditHistory
// ============================================================================

bool AuditFilter::matches(const AuditRecord& record) const {
    if (record.sequence < since_sequence) return false;
    if (outcome && record.outcome != *outcome) return false;
    if (package && normalize_package_name(record.package) != normalize_package_name(*package)) {
        return false;
    }
    return true;
}

AuditHistory::AuditHistory(AuditSnapshot records, AuditFilter filter)
    : records_(std::move(records)), filter_(std::move(filter)) {}

size_t AuditHistory::count() const {
    size_t n = 0;
    for (auto it = begin(); it != end(); ++it) ++n;
    return n;
}

std::vector<AuditRecord> AuditHistory::collect() const {
    std::vector<AuditRecord> out;
    for (const auto& rec : *this) out.push_back(rec);
    return out;
}

// ============================================================================
// Chain Verification
// ============================================================================

namespace {

template<typename Get>
ChainVerification verify_records(size_t count, Get get) {
    ChainVerification result;
    std::string expected_prev = GENESIS_HASH;
    uint64_t expected_seq = 1;

    for (size_t i = 0; i < count; ++i) {
        const AuditRecord& rec = get(i);

        auto fail = [&](const std::string& why) {
            result.ok = false;
            result.first_bad_sequence = rec.sequence;
            result.error = "record " + std::to_string(rec.sequence) + ": " + why;
        };

        if (rec.sequence != expected_seq) {
            fail("expected sequence " + std::to_string(expected_seq));
            return result;
        }
        if (rec.prev_hash != expected_prev) {
            fail("prev_hash does not match previous record");
            return result;
        }
        auto digest = compute_record_hash(rec);
        if (!digest.ok) {
            fail(digest.error);
            return result;
        }
        if (digest.hex_digest != rec.hash) {
            fail("hash mismatch");
            return result;
        }

        expected_prev = rec.hash;
        ++expected_seq;
        ++result.checked;
    }
    return result;
}

OutcomeStatus derive_outcome(const PolicyDecision& decision,
                             const std::optional<InstallResult>& install) {
    if (!decision.verdict) return OutcomeStatus::PolicyDenied;
    if (install && install->success) return OutcomeStatus::Installed;
    return OutcomeStatus::InstallFailed;
}

} // namespace

ChainVerification verify_chain(const std::vector<AuditRecord>& records) {
    return verify_records(records.size(),
                          [&](size_t i) -> const AuditRecord& { return records[i]; });
}

// ============================================================================
// AuditTrail
// ============================================================================

AuditTrail::AuditTrail(std::string path) : path_(std::move(path)) {}

std::unique_ptr<AuditTrail> AuditTrail::inMemory() {
    return std::unique_ptr<AuditTrail>(new AuditTrail(""));
}

Result<std::unique_ptr<AuditTrail>> AuditTrail::open(const std::string& path) {
    using R = Result<std::unique_ptr<AuditTrail>>;

    std::unique_ptr<AuditTrail> trail(new AuditTrail(path));
    if (path.empty() || !path_exists(path)) {
        return R::ok(std::move(trail));
    }

    auto content = read_file(path);
    if (!content) {
        return R::err(Error(ErrorCode::IO_ERROR, "cannot read audit log").withContext(path));
    }

    std::istringstream in(*content);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        auto parsed = parse_audit_record(line);
        if (!parsed.ok) {
            return R::err(Error(ErrorCode::AUDIT_CORRUPT,
                                "line " + std::to_string(line_no) + ": " + parsed.error)
                              .withContext(path));
        }
        trail->records_.push_back(std::make_shared<const AuditRecord>(std::move(parsed.value)));
    }

    auto check = trail->verifyChain();
    if (!check.ok) {
        spdlog::error("audit chain in {} is broken: {}", path, check.error);
    }
    spdlog::debug("loaded {} audit records from {}", trail->records_.size(), path);
    return R::ok(std::move(trail));
}

Result<AuditRecord> AuditTrail::record(const AuditEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    AuditRecord rec;
    rec.sequence = records_.empty() ? 1 : records_.back()->sequence + 1;
    rec.timestamp = get_current_timestamp();
    rec.package = entry.package;
    rec.actor = entry.actor;
    rec.outcome = entry.outcome;
    rec.abort_reason = entry.abort_reason;
    rec.decision = entry.decision;
    rec.install = entry.install;
    rec.prev_hash = records_.empty() ? std::string(GENESIS_HASH) : records_.back()->hash;

    auto digest = compute_record_hash(rec);
    if (!digest.ok) {
        return Result<AuditRecord>::err(Error(ErrorCode::AUDIT_WRITE_FAILED, digest.error));
    }
    rec.hash = digest.hex_digest;

    if (!path_.empty()) {
        auto written = durable_append_file(path_, dump_compact(audit_record_to_json(rec)) + "\n");
        if (!written.ok) {
            spdlog::error("audit append failed: {}", written.error);
            return Result<AuditRecord>::err(Error(ErrorCode::AUDIT_WRITE_FAILED, written.error));
        }
    }

    records_.push_back(std::make_shared<const AuditRecord>(rec));
    return Result<AuditRecord>::ok(std::move(rec));
}

Result<AuditRecord> AuditTrail::record(const std::string& actor,
                                       const PolicyDecision& decision,
                                       const std::optional<InstallResult>& install) {
    AuditEntry entry;
    entry.package = decision.package;
    entry.actor = actor;
    entry.outcome = derive_outcome(decision, install);
    entry.decision = decision;
    entry.install = install;
    return record(entry);
}

AuditSnapshot AuditTrail::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_shared<const std::vector<std::shared_ptr<const AuditRecord>>>(records_);
}

AuditHistory AuditTrail::history(AuditFilter filter) const {
    return AuditHistory(snapshot(), std::move(filter));
}

size_t AuditTrail::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::string AuditTrail::lastHash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.empty() ? std::string(GENESIS_HASH) : records_.back()->hash;
}

ChainVerification AuditTrail::verifyChain() const {
    auto records = snapshot();
    return verify_records(records->size(),
                          [&](size_t i) -> const AuditRecord& { return *(*records)[i]; });
}

} // namespace kit
