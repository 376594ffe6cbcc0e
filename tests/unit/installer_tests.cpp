#include <doctest/doctest.h>
#include <kit/installer.hpp>

#include "test_helpers.hpp"

using namespace kit;
using kit::test::TempDir;
using kit::test::make_record;
using kit::test::read_text;
using kit::test::write_script;

TEST_CASE("install commands per backend") {
    InstallerConfig config;
    config.python = "/usr/bin/python3";

    CHECK(build_install_command(Ecosystem::Pip, "mcp-server-rabel", config) ==
          std::vector<std::string>{"/usr/bin/python3", "-m", "pip", "install",
                                   "mcp-server-rabel", "-q"});
    CHECK(build_install_command(Ecosystem::Npm, "@scope/pkg", config) ==
          std::vector<std::string>{"npm", "install", "@scope/pkg"});

    CHECK(installer_executable(Ecosystem::Pip, config) == "/usr/bin/python3");
    CHECK(installer_executable(Ecosystem::Npm, config) == "npm");
}

TEST_CASE("resolve rejects ecosystems outside the closed set") {
    InstallerRouter router;

    auto cargo = router.resolve(make_record("crab", true, true, 0.9, "cargo"));
    REQUIRE(cargo.isErr());
    CHECK(cargo.error().code() == ErrorCode::UNSUPPORTED_ECOSYSTEM);
    CHECK(cargo.error().message() == "unsupported ecosystem: cargo");

    auto none = router.resolve(make_record("bare", true, true, 0.9, ""));
    REQUIRE(none.isErr());
    CHECK(none.error().message() == "unsupported ecosystem: <none>");

    CHECK(router.resolve(make_record("rabel", true, true, 0.9, "pip")).value() == Ecosystem::Pip);
}

TEST_CASE("unsupported ecosystem spawns nothing") {
    TempDir dir;
    std::string marker = dir.file("ran");
    InstallerConfig config;
    config.python = write_script(dir, "python", "touch " + marker);
    config.npm = config.python;

    InstallerRouter router(config);
    auto result = router.install(make_record("crab", true, true, 0.9, "cargo"));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::UNSUPPORTED_ECOSYSTEM);
    CHECK_FALSE(kit::test::fs::exists(marker));
}

TEST_CASE("successful install captures the command and output") {
    TempDir dir;
    std::string args = dir.file("args");
    InstallerConfig config;
    config.python = write_script(dir, "python", "echo \"$@\" > " + args + "; echo Installed ok");

    InstallerRouter router(config);
    auto result = router.install(make_record("rabel", true, true, 0.95, "pip"));
    REQUIRE(result.isOk());

    const auto& r = result.value();
    CHECK(r.success);
    CHECK(r.exit_code == 0);
    CHECK(r.installer == "pip");
    CHECK(r.package == "rabel");
    CHECK(r.output == "Installed ok\n");
    CHECK_FALSE(r.timestamp.empty());
    CHECK(read_text(args) == "-m pip install rabel -q\n");
}

TEST_CASE("non-zero exit is a failed install, not an error") {
    TempDir dir;
    InstallerConfig config;
    config.npm = write_script(dir, "npm", "echo 'E404 not found' 1>&2; exit 1");

    InstallerRouter router(config);
    auto result = router.install(make_record("bridge", true, true, 0.9, "npm"));
    REQUIRE(result.isOk());
    CHECK_FALSE(result.value().success);
    CHECK(result.value().exit_code == 1);
    CHECK(result.value().output == "E404 not found\n");
}

TEST_CASE("missing installer binary is INSTALLER_UNAVAILABLE") {
    InstallerConfig config;
    config.python = "/nonexistent/kit/python";

    InstallerRouter router(config);
    auto result = router.install(make_record("rabel", true, true, 0.95, "pip"));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INSTALLER_UNAVAILABLE);
}

TEST_CASE("installer timeout yields a timed out failure") {
    TempDir dir;
    InstallerConfig config;
    config.python = write_script(dir, "python", "exec sleep 30");
    config.timeout_ms = 200;

    InstallerRouter router(config);
    auto result = router.install(make_record("slow", true, true, 0.9, "pip"));
    REQUIRE(result.isOk());
    CHECK(result.value().timed_out);
    CHECK_FALSE(result.value().success);
}

TEST_CASE("installer leaving a background hook running still succeeds") {
    TempDir dir;
    InstallerConfig config;
    config.npm = write_script(dir, "npm", "sleep 5 & echo added 1 package; exit 0");
    config.timeout_ms = 3000;

    InstallerRouter router(config);
    auto result = router.install(make_record("bridge", true, true, 0.9, "npm"));
    REQUIRE(result.isOk());
    CHECK(result.value().success);
    CHECK_FALSE(result.value().timed_out);
    CHECK(result.value().output == "added 1 package\n");
}

TEST_CASE("isInstalled follows the show command's exit code") {
    TempDir dir;
    InstallerConfig config;
    config.python = write_script(dir, "python", "[ \"$3\" = show ] && [ \"$4\" = rabel ]");
    config.npm = write_script(dir, "npm", "[ \"$1\" = ls ] && [ \"$3\" = --depth=0 ] && exit 1");

    InstallerRouter router(config);
    auto rabel = router.isInstalled(make_record("rabel", true, true, 0.95, "pip"));
    REQUIRE(rabel.isOk());
    CHECK(rabel.value());

    auto other = router.isInstalled(make_record("ainternet", true, true, 0.9, "pip"));
    REQUIRE(other.isOk());
    CHECK_FALSE(other.value());

    auto bridge = router.isInstalled(make_record("bridge", true, true, 0.9, "npm"));
    REQUIRE(bridge.isOk());
    CHECK_FALSE(bridge.value());

    CHECK(router.isInstalled(make_record("crab", true, true, 0.9, "cargo")).error().code() ==
          ErrorCode::UNSUPPORTED_ECOSYSTEM);
}

TEST_CASE("show commands per backend") {
    InstallerConfig config;
    CHECK(build_show_command(Ecosystem::Pip, "rabel", config) ==
          std::vector<std::string>{"python3", "-m", "pip", "show", "rabel"});
    CHECK(build_show_command(Ecosystem::Npm, "bridge", config) ==
          std::vector<std::string>{"npm", "ls", "bridge", "--depth=0"});
}
