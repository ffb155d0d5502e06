#include <catch2/catch.hpp>
#include "probes/MetricsParser.hpp"

using namespace lan_watch::probes;

TEST_CASE("ParseWhoSessions excludes the monitoring user", "[metrics]")
{
    const std::string who = "mon      pts/0        2024-05-01 10:00 (10.0.0.9)\n"
                            "alice    pts/1        2024-05-01 09:12 (10.0.0.7)\n"
                            "bob      tty1         2024-05-01 08:00\n";
    REQUIRE(ParseWhoSessions(who, "mon") == 2);
    REQUIRE(ParseWhoSessions("mon pts/0 2024-05-01 10:00\n", "mon") == 0);
    REQUIRE_FALSE(ParseWhoSessions("", "mon"));
    REQUIRE_FALSE(ParseWhoSessions("\n\n", "mon"));
    REQUIRE(CountUserSessions(who, "mon") == 1);
}

TEST_CASE("ParseUptimeUsers reads the user count", "[metrics]")
{
    REQUIRE(ParseUptimeUsers(" 10:01:02 up 3 days,  2:03,  2 users,  load average: 0.00, 0.01, 0.05") == 2);
    REQUIRE(ParseUptimeUsers(" 10:01:02 up 5 min,  1 user,  load average: 0.10") == 1);
    REQUIRE_FALSE(ParseUptimeUsers("garbage"));
}

TEST_CASE("ParseCpuSamples computes busy share from two samples", "[metrics]")
{
    // total delta 1000, idle+iowait delta 573 -> 42.7 % busy
    const std::string stat = "cpu  1000 0 1000 7000 1000 0 0 0 0 0\n"
                             "cpu  1200 0 1227 7500 1073 0 0 0 0 0\n";
    auto cpu = ParseCpuSamples(stat);
    REQUIRE(cpu);
    REQUIRE(*cpu == Approx(42.7));

    REQUIRE_FALSE(ParseCpuSamples("cpu  1 2 3 4 5\n"));
    REQUIRE_FALSE(ParseCpuSamples("cpu  1 2 x 4 5\ncpu  1 2 3 4 5\n"));
    REQUIRE_FALSE(ParseCpuSamples(""));
}

TEST_CASE("ParseMemInfo uses MemAvailable over MemTotal", "[metrics]")
{
    const std::string meminfo = "MemTotal:       16000000 kB\n"
                                "MemFree:         1000000 kB\n"
                                "MemAvailable:    1920000 kB\n";
    auto mem = ParseMemInfo(meminfo);
    REQUIRE(mem);
    REQUIRE(*mem == Approx(88.0));

    REQUIRE_FALSE(ParseMemInfo("MemTotal: 100 kB\n"));
    REQUIRE_FALSE(ParseMemInfo("MemTotal: 0 kB\nMemAvailable: 0 kB\n"));
}

TEST_CASE("ParseDiskUsage reads Use% of the first row", "[metrics]")
{
    const std::string df = "Filesystem     1024-blocks      Used Available Capacity Mounted on\n"
                           "/dev/sda1         41152736  30864552   8175340      80% /\n";
    REQUIRE(ParseDiskUsage(df) == 80.0);
    REQUIRE(ParseDiskUsage("Filesystem 1024-blocks Used Available Capacity Mounted on\n"
                           "/dev/sda1 1 1 0 150% /\n") == 150.0);
    REQUIRE_FALSE(ParseDiskUsage("Filesystem\n"));
    REQUIRE_FALSE(ParseDiskUsage("header\n/dev/sda1 1 1 0 -% /\n"));
}

TEST_CASE("ParseIpv4Addresses filters loopback, link-local and broadcast", "[metrics]")
{
    const std::string ipOutput =
        "2: eth0    inet 10.0.0.5/24 brd 10.0.0.255 scope global eth0\\       valid_lft forever\n"
        "3: eth1    inet 192.168.1.20/24 brd 192.168.1.255 scope global eth1\n"
        "4: lo      inet 127.0.0.1/8 scope host lo\n"
        "5: eth2    inet 169.254.3.4/16 scope global eth2\n";
    auto addrs = ParseIpv4Addresses(ipOutput);
    REQUIRE(addrs == std::vector<std::string>{"10.0.0.5", "192.168.1.20"});

    REQUIRE(ParseIpv4Addresses("10.0.0.5 10.0.0.5 172.17.0.1 \n") ==
            std::vector<std::string>{"10.0.0.5", "172.17.0.1"});
    REQUIRE(ParseIpv4Addresses("999.1.1.1 1.2.3 fe80::1").empty());
}
