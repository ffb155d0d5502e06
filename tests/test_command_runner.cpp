#include <catch2/catch.hpp>
#include "common/CommandRunner.hpp"
#include <chrono>

using namespace std::chrono_literals;
using lan_watch::common::FailureKind;
using lan_watch::common::RunCommand;

TEST_CASE("RunCommand captures stdout and the exit code", "[command]")
{
    auto result = RunCommand({"echo", "hello"}, 2000ms);
    REQUIRE(result);
    REQUIRE(result.Value().exit_code == 0);
    REQUIRE(result.Value().output == "hello\n");

    auto failing = RunCommand({"false"}, 2000ms);
    REQUIRE(failing);
    REQUIRE(failing.Value().exit_code != 0);
}

TEST_CASE("RunCommand kills a child that outlives the timeout", "[command]")
{
    auto start = std::chrono::steady_clock::now();
    auto result = RunCommand({"sleep", "5"}, 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(result);
    REQUIRE(result.Kind() == FailureKind::Timeout);
    REQUIRE(elapsed < 2s);
}

TEST_CASE("RunCommand reports a missing program as a failed exit", "[command]")
{
    auto result = RunCommand({"/nonexistent/lanwatch-binary"}, 1000ms);
    if (result)
        REQUIRE(result.Value().exit_code != 0);
    else
        REQUIRE(result.Kind() == FailureKind::ProbeError);

    REQUIRE_FALSE(RunCommand({}, 1000ms));
}
