#include <doctest/doctest.h>
#include <kit/process.hpp>

#include "test_helpers.hpp"

#include <chrono>

using namespace kit;
using kit::test::TempDir;
using kit::test::write_script;

TEST_CASE("run_process captures stdout and stderr") {
    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", "echo out; echo err 1>&2"};
    auto result = run_process(options);

    REQUIRE(result.spawned);
    CHECK(result.exit_code == 0);
    CHECK_FALSE(result.timed_out);
    CHECK(result.output.find("out\n") != std::string::npos);
    CHECK(result.output.find("err\n") != std::string::npos);
}

TEST_CASE("run_process reports non-zero exit codes") {
    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", "exit 3"};
    auto result = run_process(options);
    REQUIRE(result.spawned);
    CHECK(result.exit_code == 3);
}

TEST_CASE("run_process passes arguments without a shell") {
    TempDir dir;
    auto script = write_script(dir, "args.sh", "for a in \"$@\"; do echo \"[$a]\"; done");

    ProcessOptions options;
    options.argv = {script, "two words", "$HOME"};
    auto result = run_process(options);
    REQUIRE(result.spawned);
    CHECK(result.output == "[two words]\n[$HOME]\n");
}

TEST_CASE("missing binary is not spawned") {
    ProcessOptions options;
    options.argv = {"kit-definitely-not-a-real-binary"};
    auto result = run_process(options);
    CHECK_FALSE(result.spawned);
    CHECK(result.error.find("cannot execute") != std::string::npos);
}

TEST_CASE("non-executable file is not spawned") {
    TempDir dir;
    kit::test::write_text(dir.file("plain"), "echo hi\n");
    ProcessOptions options;
    options.argv = {dir.file("plain")};
    CHECK_FALSE(run_process(options).spawned);
}

TEST_CASE("empty argv is rejected") {
    auto result = run_process(ProcessOptions{});
    CHECK_FALSE(result.spawned);
    CHECK(result.error == "empty command");
}

TEST_CASE("run_process kills a child that outlives its timeout") {
    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", "echo started; exec sleep 30"};
    options.timeout_ms = 300;

    auto start = std::chrono::steady_clock::now();
    auto result = run_process(options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.spawned);
    CHECK(result.timed_out);
    CHECK(result.exit_code == 128 + 15);
    CHECK(result.output.find("started") != std::string::npos);
    CHECK(elapsed < std::chrono::seconds(10));
}

TEST_CASE("run_process keeps the tail of oversized output") {
    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", "i=0; while [ $i -lt 500 ]; do echo line$i; i=$((i+1)); done"};
    options.output_limit = 64;
    auto result = run_process(options);

    REQUIRE(result.spawned);
    CHECK(result.truncated);
    CHECK(result.output.size() == 64);
    CHECK(result.output.find("line499\n") != std::string::npos);
}

TEST_CASE("background grandchild holding the pipe does not delay the result") {
    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", "sleep 5 & echo done; exit 0"};
    options.timeout_ms = 3000;

    auto start = std::chrono::steady_clock::now();
    auto result = run_process(options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.spawned);
    CHECK(result.exit_code == 0);
    CHECK_FALSE(result.timed_out);
    CHECK(result.output == "done\n");
    CHECK(elapsed < std::chrono::milliseconds(2500));
}

TEST_CASE("background grandchild without a timeout still returns") {
    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", "sleep 5 & exit 4"};

    auto start = std::chrono::steady_clock::now();
    auto result = run_process(options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.spawned);
    CHECK(result.exit_code == 4);
    CHECK_FALSE(result.timed_out);
    CHECK(elapsed < std::chrono::seconds(4));
}
