#include <catch2/catch.hpp>
#include "common/ProbeResult.hpp"

using lan_watch::common::FailureKind;
using lan_watch::common::ProbeResult;

TEST_CASE("ProbeResult success carries the value", "[probe_result]")
{
    auto result = ProbeResult<int>::Success(42);
    REQUIRE(result.IsSuccess());
    REQUIRE(static_cast<bool>(result));
    REQUIRE(result.Value() == 42);
}

TEST_CASE("ProbeResult failure carries kind and message", "[probe_result]")
{
    auto result = ProbeResult<std::string>::Failure(FailureKind::AuthFailed, "denied");
    REQUIRE_FALSE(result);
    REQUIRE(result.Kind() == FailureKind::AuthFailed);
    REQUIRE(result.Error().message == "denied");
}

TEST_CASE("FailureKind names", "[probe_result]")
{
    REQUIRE(std::string(ToString(FailureKind::Timeout)) == "Timeout");
    REQUIRE(std::string(ToString(FailureKind::ApiUnauthorized)) == "ApiUnauthorized");
    REQUIRE(std::string(ToString(FailureKind::ParseError)) == "ParseError");
}
