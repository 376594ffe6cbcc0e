#pragma once

#include "kit/result.hpp"
#include "kit/types.hpp"

#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kit {

// prev_hash of the first record in every chain
constexpr const char* GENESIS_HASH =
    "0000000000000000000000000000000000000000000000000000000000000000";

// ============================================================================
// SHA-256
// ============================================================================

struct DigestResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;  // lowercase
};

DigestResult compute_sha256(const std::string& data);

// sha256(prev_hash + "\n" + canonical record without hash)
DigestResult compute_record_hash(const AuditRecord& record);

// ============================================================================
// History View
// ============================================================================

struct AuditFilter {
    std::optional<std::string> package;        // normalized name match
    std::optional<OutcomeStatus> outcome;
    uint64_t since_sequence = 0;               // records with sequence >= this

    bool matches(const AuditRecord& record) const;
};

using AuditSnapshot = std::shared_ptr<const std::vector<std::shared_ptr<const AuditRecord>>>;

/// Lazily filtered, read-only view over a point-in-time copy of the trail.
/// Records appended after the view was taken are not visible through it.
class AuditHistory {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = AuditRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const AuditRecord*;
        using reference = const AuditRecord&;

        const_iterator() = default;

        reference operator*() const { return *(*records_)[pos_]; }
        pointer operator->() const { return (*records_)[pos_].get(); }

        const_iterator& operator++() {
            ++pos_;
            skip();
            return *this;
        }
        const_iterator operator++(int) {
            auto copy = *this;
            ++(*this);
            return copy;
        }

        bool operator==(const const_iterator& other) const { return pos_ == other.pos_; }
        bool operator!=(const const_iterator& other) const { return pos_ != other.pos_; }

    private:
        friend class AuditHistory;
        const_iterator(const AuditHistory* owner, size_t pos)
            : records_(owner->records_.get()), filter_(&owner->filter_), pos_(pos) {
            skip();
        }

        void skip() {
            while (pos_ < records_->size() && !filter_->matches(*(*records_)[pos_])) {
                ++pos_;
            }
        }

        const std::vector<std::shared_ptr<const AuditRecord>>* records_ = nullptr;
        const AuditFilter* filter_ = nullptr;
        size_t pos_ = 0;
    };

    AuditHistory(AuditSnapshot records, AuditFilter filter);

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, records_->size()); }

    bool empty() const { return begin() == end(); }
    size_t count() const;
    std::vector<AuditRecord> collect() const;

private:
    AuditSnapshot records_;
    AuditFilter filter_;
};

// ============================================================================
// Audit Trail
// ============================================================================

// What the caller supplies; sequencing and hashing are added by the trail
struct AuditEntry {
    std::string package;
    std::string actor;
    OutcomeStatus outcome = OutcomeStatus::NotFound;
    std::optional<std::string> abort_reason;
    std::optional<PolicyDecision> decision;
    std::optional<InstallResult> install;
};

struct ChainVerification {
    bool ok = true;
    size_t checked = 0;
    std::optional<uint64_t> first_bad_sequence;
    std::string error;
};

/// Append-only, hash-chained log of install decisions.
/// With a path every record is appended to an NDJSON file and fsynced
/// before it becomes visible; with an empty path the trail is memory-only.
/// All methods are safe to call from multiple threads.
class AuditTrail {
public:
    /// Open a trail, loading and continuing any chain already in the file.
    /// Fails with IO_ERROR if the file cannot be read or AUDIT_CORRUPT if a
    /// line does not parse.
    static Result<std::unique_ptr<AuditTrail>> open(const std::string& path);

    /// In-memory trail (nothing persisted)
    static std::unique_ptr<AuditTrail> inMemory();

    AuditTrail(const AuditTrail&) = delete;
    AuditTrail& operator=(const AuditTrail&) = delete;

    const std::string& path() const { return path_; }

    /// Append one entry. Fails with AUDIT_WRITE_FAILED when persisting fails;
    /// the chain is then left exactly as it was.
    Result<AuditRecord> record(const AuditEntry& entry);

    /// Convenience form: outcome is derived from the decision and install result.
    Result<AuditRecord> record(const std::string& actor,
                               const PolicyDecision& decision,
                               const std::optional<InstallResult>& install);

    AuditHistory history(AuditFilter filter = {}) const;

    size_t size() const;
    std::string lastHash() const;

    ChainVerification verifyChain() const;

private:
    explicit AuditTrail(std::string path);

    AuditSnapshot snapshot() const;

    std::string path_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<const AuditRecord>> records_;
};

/// Check sequence continuity, prev_hash links and recomputed hashes.
ChainVerification verify_chain(const std::vector<AuditRecord>& records);

} // namespace kit
