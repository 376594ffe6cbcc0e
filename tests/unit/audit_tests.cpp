#include <doctest/doctest.h>
#include <kit/audit.hpp>
#include <kit/serialize.hpp>

#include "test_helpers.hpp"

#include <set>
#include <sstream>
#include <thread>

using namespace kit;
using kit::test::TempDir;
using kit::test::read_text;
using kit::test::write_text;

namespace {

AuditEntry entry(const std::string& package, OutcomeStatus outcome) {
    AuditEntry e;
    e.package = package;
    e.actor = "tester";
    e.outcome = outcome;
    if (outcome == OutcomeStatus::NotFound) e.abort_reason = "not found";
    return e;
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

} // namespace

TEST_CASE("sha256 of a known input") {
    auto d = compute_sha256("abc");
    REQUIRE(d.ok);
    CHECK(d.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("records are sequenced and chained from genesis") {
    auto trail = AuditTrail::inMemory();

    auto first = trail->record(entry("rabel", OutcomeStatus::Installed));
    auto second = trail->record(entry("shady", OutcomeStatus::PolicyDenied));
    REQUIRE(first.isOk());
    REQUIRE(second.isOk());

    CHECK(first.value().sequence == 1);
    CHECK(first.value().prev_hash == GENESIS_HASH);
    CHECK(first.value().hash.size() == 64);
    CHECK(second.value().sequence == 2);
    CHECK(second.value().prev_hash == first.value().hash);
    CHECK(trail->lastHash() == second.value().hash);
    CHECK(trail->size() == 2);

    auto check = trail->verifyChain();
    CHECK(check.ok);
    CHECK(check.checked == 2);
}

TEST_CASE("record with decision derives the outcome") {
    auto trail = AuditTrail::inMemory();

    PolicyDecision denied;
    denied.package = "shady";
    denied.reasons = {"not verified"};
    CHECK(trail->record("tester", denied, std::nullopt).value().outcome ==
          OutcomeStatus::PolicyDenied);

    PolicyDecision allowed;
    allowed.package = "rabel";
    allowed.verdict = true;
    InstallResult ok;
    ok.success = true;
    ok.exit_code = 0;
    CHECK(trail->record("tester", allowed, ok).value().outcome == OutcomeStatus::Installed);

    InstallResult failed;
    failed.exit_code = 1;
    auto rec = trail->record("tester", allowed, failed);
    CHECK(rec.value().outcome == OutcomeStatus::InstallFailed);
    CHECK(rec.value().install->exit_code == 1);
}

TEST_CASE("persisted trail is NDJSON and reopens to continue the chain") {
    TempDir dir;
    std::string path = dir.file("audit.ndjson");

    std::string last_hash;
    {
        auto trail = AuditTrail::open(path);
        REQUIRE(trail.isOk());
        REQUIRE(trail.value()->record(entry("rabel", OutcomeStatus::Installed)).isOk());
        auto second = trail.value()->record(entry("nonexistent", OutcomeStatus::NotFound));
        REQUIRE(second.isOk());
        last_hash = second.value().hash;
    }

    auto lines = lines_of(read_text(path));
    REQUIRE(lines.size() == 2);
    auto parsed = parse_audit_record(lines[1]);
    REQUIRE(parsed.ok);
    CHECK(parsed.value.package == "nonexistent");
    REQUIRE(parsed.value.abort_reason.has_value());
    CHECK(*parsed.value.abort_reason == "not found");
    CHECK_FALSE(parsed.value.install.has_value());

    auto reopened = AuditTrail::open(path);
    REQUIRE(reopened.isOk());
    CHECK(reopened.value()->size() == 2);
    CHECK(reopened.value()->lastHash() == last_hash);

    auto third = reopened.value()->record(entry("ainternet", OutcomeStatus::Installed));
    REQUIRE(third.isOk());
    CHECK(third.value().sequence == 3);
    CHECK(third.value().prev_hash == last_hash);
    CHECK(reopened.value()->verifyChain().ok);
}

TEST_CASE("full records survive a reload byte for byte") {
    TempDir dir;
    std::string path = dir.file("audit.ndjson");

    AuditEntry e = entry("rabel", OutcomeStatus::InstallFailed);
    PolicyDecision d;
    d.package = "rabel";
    d.verdict = true;
    d.min_trust = 0.7;
    IntentCheckResult intent;
    intent.status = IntentStatus::Clear;
    intent.rationale = "[SAFE]";
    d.intent = intent;
    e.decision = d;
    InstallResult r;
    r.package = "rabel";
    r.installer = "pip";
    r.command = {"python3", "-m", "pip", "install", "rabel", "-q"};
    r.exit_code = 1;
    r.output = "ERROR: \xff bad bytes\n";
    e.install = r;

    {
        auto trail = AuditTrail::open(path);
        REQUIRE(trail.isOk());
        REQUIRE(trail.value()->record(e).isOk());
    }

    auto reopened = AuditTrail::open(path);
    REQUIRE(reopened.isOk());
    CHECK(reopened.value()->verifyChain().ok);

    auto records = reopened.value()->history().collect();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].decision.has_value());
    CHECK(records[0].decision->min_trust == doctest::Approx(0.7));
    REQUIRE(records[0].decision->intent.has_value());
    CHECK(records[0].decision->intent->status == IntentStatus::Clear);
    REQUIRE(records[0].install.has_value());
    CHECK(records[0].install->command.size() == 6);
}

TEST_CASE("tampering with a persisted record breaks the chain") {
    TempDir dir;
    std::string path = dir.file("audit.ndjson");
    {
        auto trail = AuditTrail::open(path);
        REQUIRE(trail.isOk());
        for (auto name : {"a", "b", "c"}) {
            REQUIRE(trail.value()->record(entry(name, OutcomeStatus::PolicyDenied)).isOk());
        }
    }

    auto lines = lines_of(read_text(path));
    REQUIRE(lines.size() == 3);
    auto pos = lines[1].find("policy_denied");
    REQUIRE(pos != std::string::npos);
    lines[1].replace(pos, std::string("policy_denied").size(), "installed");
    write_text(path, lines[0] + "\n" + lines[1] + "\n" + lines[2] + "\n");

    auto reopened = AuditTrail::open(path);
    REQUIRE(reopened.isOk());
    auto check = reopened.value()->verifyChain();
    CHECK_FALSE(check.ok);
    REQUIRE(check.first_bad_sequence.has_value());
    CHECK(*check.first_bad_sequence == 2);
    CHECK(check.checked == 1);
}

TEST_CASE("dropping a record breaks the chain") {
    auto trail = AuditTrail::inMemory();
    for (auto name : {"a", "b", "c"}) {
        REQUIRE(trail->record(entry(name, OutcomeStatus::Installed)).isOk());
    }
    auto records = trail->history().collect();
    records.erase(records.begin() + 1);

    auto check = verify_chain(records);
    CHECK_FALSE(check.ok);
    CHECK(*check.first_bad_sequence == 3);
}

TEST_CASE("unparsable audit log fails to open") {
    TempDir dir;
    std::string path = dir.file("audit.ndjson");
    write_text(path, "{\"sequence\": 1}\nnot json\n");

    auto trail = AuditTrail::open(path);
    REQUIRE(trail.isErr());
    CHECK(trail.error().code() == ErrorCode::AUDIT_CORRUPT);
}

TEST_CASE("wrongly typed install fields are reported as a corrupt log") {
    TempDir dir;
    std::string path = dir.file("audit.ndjson");
    {
        auto trail = AuditTrail::open(path);
        REQUIRE(trail.isOk());
        AuditEntry e = entry("rabel", OutcomeStatus::Installed);
        InstallResult r;
        r.package = "rabel";
        r.installer = "pip";
        r.exit_code = 0;
        r.success = true;
        e.install = r;
        REQUIRE(trail.value()->record(e).isOk());
    }

    auto text = read_text(path);
    auto pos = text.find("\"success\":true");
    REQUIRE(pos != std::string::npos);
    text.replace(pos, std::string("\"success\":true").size(), "\"success\":\"yes\"");
    write_text(path, text);

    auto reopened = AuditTrail::open(path);
    REQUIRE(reopened.isErr());
    CHECK(reopened.error().code() == ErrorCode::AUDIT_CORRUPT);
}

TEST_CASE("parse_audit_record rejects non-boolean install flags") {
    auto trail = AuditTrail::inMemory();
    AuditEntry e = entry("rabel", OutcomeStatus::InstallFailed);
    InstallResult r;
    r.exit_code = 1;
    e.install = r;
    auto rec = trail->record(e);
    REQUIRE(rec.isOk());

    auto j = audit_record_to_json(rec.value());
    REQUIRE(parse_audit_record(j.dump()).ok);

    j["install"]["timed_out"] = 1;
    auto parsed = parse_audit_record(j.dump());
    CHECK_FALSE(parsed.ok);
    CHECK(parsed.error == "install.timed_out must be a boolean");
}

TEST_CASE("write failure leaves the chain untouched") {
    TempDir dir;
    write_text(dir.file("blocker"), "a regular file");

    auto trail = AuditTrail::open(dir.file("blocker") + "/audit.ndjson");
    REQUIRE(trail.isOk());

    auto result = trail.value()->record(entry("rabel", OutcomeStatus::Installed));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::AUDIT_WRITE_FAILED);
    CHECK(trail.value()->size() == 0);
    CHECK(trail.value()->lastHash() == GENESIS_HASH);
}

TEST_CASE("concurrent appends get unique gap-free sequence numbers") {
    TempDir dir;
    auto opened = AuditTrail::open(dir.file("audit.ndjson"));
    REQUIRE(opened.isOk());
    AuditTrail& trail = *opened.value();

    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 25;
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&trail, t]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                auto r = trail.record(entry("pkg" + std::to_string(t), OutcomeStatus::Installed));
                (void)r;
            }
        });
    }
    for (auto& th : threads) th.join();

    auto records = trail.history().collect();
    REQUIRE(records.size() == THREADS * PER_THREAD);
    std::set<uint64_t> seen;
    for (size_t i = 0; i < records.size(); ++i) {
        CHECK(records[i].sequence == i + 1);
        seen.insert(records[i].sequence);
    }
    CHECK(seen.size() == records.size());
    CHECK(trail.verifyChain().ok);

    auto reopened = AuditTrail::open(dir.file("audit.ndjson"));
    REQUIRE(reopened.isOk());
    CHECK(reopened.value()->verifyChain().ok);
}

// ============================================================================
// History View
// ============================================================================

TEST_CASE("history filters lazily over a snapshot") {
    auto trail = AuditTrail::inMemory();
    REQUIRE(trail->record(entry("rabel", OutcomeStatus::Installed)).isOk());
    REQUIRE(trail->record(entry("shady", OutcomeStatus::PolicyDenied)).isOk());
    REQUIRE(trail->record(entry("Rabel", OutcomeStatus::InstallFailed)).isOk());
    REQUIRE(trail->record(entry("ghost", OutcomeStatus::NotFound)).isOk());

    SUBCASE("no filter yields everything oldest first") {
        auto all = trail->history();
        CHECK(all.count() == 4);
        CHECK(all.begin()->package == "rabel");
    }

    SUBCASE("by package, case-insensitive") {
        AuditFilter f;
        f.package = "RABEL";
        auto view = trail->history(f);
        CHECK(view.count() == 2);
    }

    SUBCASE("by outcome") {
        AuditFilter f;
        f.outcome = OutcomeStatus::NotFound;
        auto records = trail->history(f).collect();
        REQUIRE(records.size() == 1);
        CHECK(records[0].package == "ghost");
    }

    SUBCASE("since a sequence number") {
        AuditFilter f;
        f.since_sequence = 3;
        auto records = trail->history(f).collect();
        REQUIRE(records.size() == 2);
        CHECK(records[0].sequence == 3);
    }

    SUBCASE("nothing matches") {
        AuditFilter f;
        f.package = "nobody";
        CHECK(trail->history(f).empty());
    }
}

TEST_CASE("history view does not see later appends") {
    auto trail = AuditTrail::inMemory();
    REQUIRE(trail->record(entry("a", OutcomeStatus::Installed)).isOk());

    auto view = trail->history();
    REQUIRE(trail->record(entry("b", OutcomeStatus::Installed)).isOk());

    CHECK(view.count() == 1);
    CHECK(trail->history().count() == 2);
}
