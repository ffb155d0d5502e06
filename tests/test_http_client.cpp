#include <catch2/catch.hpp>
#include "common/HttpClient.hpp"
#include "common/SocketUtil.hpp"
#include <chrono>

using namespace std::chrono_literals;
using namespace lan_watch::common;

TEST_CASE("ParseUrl splits scheme, host, port and path", "[http]")
{
    auto url = ParseUrl("https://gns3.lab:3443/v3/version");
    REQUIRE(url);
    REQUIRE(url->IsTls());
    REQUIRE(url->host == "gns3.lab");
    REQUIRE(url->port == 3443);
    REQUIRE(url->path == "/v3/version");

    auto plain = ParseUrl("http://10.0.0.5");
    REQUIRE(plain);
    REQUIRE(plain->port == 80);
    REQUIRE(plain->path == "/");

    REQUIRE(ParseUrl("HTTPS://host")->port == 443);
    REQUIRE_FALSE(ParseUrl("ftp://host/"));
    REQUIRE_FALSE(ParseUrl("10.0.0.5:3080"));
    REQUIRE_FALSE(ParseUrl("http://host:99999/"));
    REQUIRE_FALSE(ParseUrl("http://:80/"));
}

TEST_CASE("Url origin keeps the resolved port", "[http]")
{
    REQUIRE(ParseUrl("https://10.0.0.5/v2/version")->Origin() == "https://10.0.0.5:443");
    REQUIRE(ParseUrl("http://gns3.lab:3080")->Origin() == "http://gns3.lab:3080");
}

TEST_CASE("HttpClient reports unusable URLs and closed ports", "[http]")
{
    HttpClient client;

    auto bad = client.Get("not a url", {}, 200ms);
    REQUIRE_FALSE(bad);
    REQUIRE(bad.Kind() == FailureKind::ProbeError);

    // Port 1 on loopback is closed on any sane test machine.
    auto refused = client.Get("http://127.0.0.1:1/v3/version", {}, 500ms);
    REQUIRE_FALSE(refused);
    REQUIRE((refused.Kind() == FailureKind::Unreachable || refused.Kind() == FailureKind::Timeout));
    REQUIRE_FALSE(TcpPortOpen("127.0.0.1", 1, 300ms));
}
