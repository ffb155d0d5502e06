#include <catch2/catch.hpp>
#include "common/ConfigLoader.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using lan_watch::common::ConfigError;
using lan_watch::common::ConfigLoader;

TEST_CASE("ConfigLoader parses a full device entry", "[config]")
{
    auto config = ConfigLoader::Parse(R"({
        "scan_interval_seconds": 60,
        "cycle_deadline_seconds": 20,
        "max_concurrency": 4,
        "timeouts_ms": { "ping": 500, "ssh": 3000 },
        "devices": [
          { "id": "srv1", "name": "Server 1", "ip": "10.0.0.5", "mac": "AA:BB:CC:DD:EE:FF",
            "broadcast": "10.0.0.255",
            "ssh":  { "username": "mon", "password": "secret", "port": 2222 },
            "gns3": { "server_url": "http://10.0.0.5:3080/", "access_token": "t", "token_type": "Bearer" } }
        ]
    })");

    REQUIRE(config.scan_interval_seconds == 60);
    REQUIRE(config.cycle_deadline_seconds == 20);
    REQUIRE(config.max_concurrency == 4);
    REQUIRE(config.timeouts.ping.count() == 500);
    REQUIRE(config.timeouts.ssh.count() == 3000);
    REQUIRE(config.timeouts.neighbor.count() == 1000);

    REQUIRE(config.devices.size() == 1);
    const auto &device = config.devices[0];
    REQUIRE(device.id == "srv1");
    REQUIRE(device.name == "Server 1");
    REQUIRE(device.broadcast == "10.0.0.255");
    REQUIRE(device.mac == "aa:bb:cc:dd:ee:ff");
    REQUIRE(device.ssh);
    REQUIRE(device.ssh->port == 2222);
    REQUIRE(device.SshHost() == "10.0.0.5");
    REQUIRE(device.gns3);
    REQUIRE(device.gns3->base_url == "http://10.0.0.5:3080");
    REQUIRE(device.gns3->token_type == "bearer");
}

TEST_CASE("ConfigLoader applies defaults and limits", "[config]")
{
    SECTION("interval below the minimum is raised")
    {
        auto config = ConfigLoader::Parse(R"({"scan_interval_seconds": 1, "devices": []})");
        REQUIRE(config.scan_interval_seconds == 5);
        REQUIRE(config.cycle_deadline_seconds == 5);
    }
    SECTION("deadline is capped at the interval")
    {
        auto config = ConfigLoader::Parse(R"({"scan_interval_seconds": 10, "cycle_deadline_seconds": 99})");
        REQUIRE(config.cycle_deadline_seconds == 10);
    }
    SECTION("missing ids fall back to the position")
    {
        auto config = ConfigLoader::Parse(R"({"devices": [{"ip": "10.0.0.1"}, {"ip": "10.0.0.2"}]})");
        REQUIRE(config.devices[0].id == "0");
        REQUIRE(config.devices[1].id == "1");
        REQUIRE_FALSE(config.devices[0].ssh);
        REQUIRE_FALSE(config.devices[0].gns3);
    }
}

TEST_CASE("ConfigLoader rejects invalid configuration", "[config]")
{
    REQUIRE_THROWS_AS(ConfigLoader::Parse("{ not json"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::Parse("[]"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::Parse(R"({"devices": [{"name": "x"}]})"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::Parse(R"({"devices": [{"ip": "300.1.1.1"}]})"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::Parse(R"({"devices": [{"ip": "10.0.0.1", "broadcast": "nope"}]})"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::Parse(R"({"devices": [{"ip": "10.0.0.1", "ssh": {"username": "u"}}]})"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::Parse(R"({"devices": [{"ip": "10.0.0.1", "gns3": {"access_token": "t"}}]})"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::Parse(R"({"devices": [{"id": "a", "ip": "10.0.0.1"}, {"id": "a", "ip": "10.0.0.2"}]})"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::Parse(R"({"max_concurrency": 0})"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::Parse(R"({"timeouts_ms": {"ping": 0}})"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::Parse(R"({"scan_interval_seconds": "fast"})"), ConfigError);
}

TEST_CASE("ConfigLoader treats a missing file as an empty fleet", "[config]")
{
    auto config = ConfigLoader::LoadFile("/nonexistent/lanwatch/devices.json");
    REQUIRE(config.devices.empty());
    REQUIRE(config.scan_interval_seconds == 30);
}

TEST_CASE("ConfigLoader reads the environment", "[config]")
{
    const std::string path = "lanwatch_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"scan_interval_seconds": 30, "devices": [{"id": "a", "ip": "10.0.0.1"}]})";
    }

    setenv("SCAN_INTERVAL", "12", 1);
    auto config = ConfigLoader::LoadFromEnvironment(path);
    unsetenv("SCAN_INTERVAL");
    std::remove(path.c_str());

    REQUIRE(config.devices.size() == 1);
    REQUIRE(config.scan_interval_seconds == 12);
    REQUIRE(config.cycle_deadline_seconds == 12);
}

TEST_CASE("ConfigLoader reads the YAML device file", "[config]")
{
    auto config = ConfigLoader::ParseYaml(R"(
scan_interval_seconds: 45
timeouts_ms:
  hostname: 700
devices:
  - name: srv1
    ip: 10.0.0.5
    mac: "AA:BB:CC:DD:EE:FF"
    ssh:
      username: mon
      password: secret
    gns3key:
      server_url: "https://10.0.0.5:3443/"
      access_token: t0k3n
  - name: switch
    ip: 10.0.0.2
    ssh: {}
    gns3key: {}
)");

    REQUIRE(config.scan_interval_seconds == 45);
    REQUIRE(config.timeouts.hostname.count() == 700);
    REQUIRE(config.devices.size() == 2);

    const auto &srv = config.devices[0];
    REQUIRE(srv.id == "0");
    REQUIRE(srv.name == "srv1");
    REQUIRE(srv.mac == "aa:bb:cc:dd:ee:ff");
    REQUIRE(srv.ssh);
    REQUIRE(srv.ssh->port == 22);
    REQUIRE(srv.gns3);
    REQUIRE(srv.gns3->base_url == "https://10.0.0.5:3443");
    REQUIRE(srv.gns3->token == "t0k3n");

    REQUIRE(config.devices[1].id == "1");
    REQUIRE_FALSE(config.devices[1].ssh);
    REQUIRE_FALSE(config.devices[1].gns3);

    REQUIRE_THROWS_AS(ConfigLoader::ParseYaml("devices:\n  - name: x\n"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::ParseYaml("- just\n- a list\n"), ConfigError);
}

TEST_CASE("ConfigLoader picks the format from the file extension", "[config]")
{
    const std::string yamlPath = "lanwatch_test_devices.yaml";
    const std::string jsonPath = "lanwatch_test_devices.json";
    {
        std::ofstream yaml(yamlPath);
        yaml << "devices:\n  - id: a\n    ip: 10.0.0.1\n";
        std::ofstream json(jsonPath);
        json << R"({"devices": [{"id": "b", "ip": "10.0.0.2", "gns3key": {"server_url": "http://10.0.0.2:3080"}}]})";
    }

    auto fromYaml = ConfigLoader::LoadFile(yamlPath);
    auto fromJson = ConfigLoader::LoadFile(jsonPath);
    std::remove(yamlPath.c_str());
    std::remove(jsonPath.c_str());

    REQUIRE(fromYaml.devices.size() == 1);
    REQUIRE(fromYaml.devices[0].id == "a");
    REQUIRE(fromJson.devices.size() == 1);
    REQUIRE(fromJson.devices[0].gns3);
    REQUIRE(fromJson.devices[0].gns3->base_url == "http://10.0.0.2:3080");
}
