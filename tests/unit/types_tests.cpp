#include <doctest/doctest.h>
#include <kit/result.hpp>
#include <kit/types.hpp>

#include <memory>

using namespace kit;

TEST_CASE("parse_ecosystem accepts the closed set") {
    CHECK(parse_ecosystem("pip") == Ecosystem::Pip);
    CHECK(parse_ecosystem("PyPI") == Ecosystem::Pip);
    CHECK(parse_ecosystem("npm") == Ecosystem::Npm);
    CHECK_FALSE(parse_ecosystem("cargo").has_value());
    CHECK_FALSE(parse_ecosystem("").has_value());
}

TEST_CASE("ecosystem names") {
    CHECK(std::string(ecosystem_to_string(Ecosystem::Pip)) == "pip");
    CHECK(std::string(ecosystem_to_string(Ecosystem::Npm)) == "npm");
}

TEST_CASE("outcome status string forms parse back") {
    for (auto status : {OutcomeStatus::Installed, OutcomeStatus::NotFound,
                        OutcomeStatus::PolicyDenied, OutcomeStatus::UnsupportedEcosystem,
                        OutcomeStatus::InstallerUnavailable, OutcomeStatus::InstallFailed}) {
        auto parsed = parse_outcome_status(outcome_status_to_string(status));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == status);
    }
    CHECK_FALSE(parse_outcome_status("done").has_value());
}

TEST_CASE("intent result is three-valued") {
    IntentCheckResult r;
    CHECK_FALSE(r.checked());
    CHECK_FALSE(r.flagged());

    r.status = IntentStatus::Clear;
    CHECK(r.checked());
    CHECK_FALSE(r.flagged());

    r.status = IntentStatus::Flagged;
    CHECK(r.checked());
    CHECK(r.flagged());
}

TEST_CASE("PackageRecord equality covers every field") {
    PackageRecord a;
    a.name = "rabel";
    a.trust_score = 0.95;
    PackageRecord b = a;
    CHECK(a == b);

    b.mcp_command = "rabel";
    CHECK(a != b);
}

TEST_CASE("Result carries value or error") {
    auto ok = Result<int>::ok(3);
    CHECK(ok.isOk());
    CHECK(ok.value() == 3);

    auto err = Result<int>::err(Error(ErrorCode::NOT_FOUND, "missing"));
    CHECK(err.isErr());
    CHECK(err.error().toString() == "NOT_FOUND: missing");
}

TEST_CASE("Result holds move-only values") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(7));
    REQUIRE(r.isOk());
    auto owned = std::move(r.value());
    CHECK(*owned == 7);
}

TEST_CASE("Error context is prefixed") {
    Error e(ErrorCode::IO_ERROR, "cannot read");
    e.withContext("/tmp/x");
    CHECK(e.message() == "/tmp/x: cannot read");
}
