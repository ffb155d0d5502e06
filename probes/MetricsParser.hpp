#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lan_watch::probes
{
    // Parsers for the output of the remote introspection commands. Each one
    // returns nullopt when its input is unusable.

    // `who`: sessions not owned by monitorUser; nullopt when there are no sessions listed.
    std::optional<int> ParseWhoSessions(const std::string &who, const std::string &monitorUser);

    // `uptime`: the "N user(s)" figure.
    std::optional<int> ParseUptimeUsers(const std::string &uptime);

    int CountUserSessions(const std::string &who, const std::string &user);

    // Two `cpu ` lines of /proc/stat taken some time apart.
    std::optional<double> ParseCpuSamples(const std::string &statOutput);

    // /proc/meminfo: 100 * (1 - MemAvailable / MemTotal).
    std::optional<double> ParseMemInfo(const std::string &meminfo);

    // `df -P /`: Use% of the first filesystem row.
    std::optional<double> ParseDiskUsage(const std::string &df);

    // IPv4 literals in `ip -o addr` / `hostname -I` output, loopback and
    // link-local and `brd` addresses excluded, de-duplicated in order of appearance.
    std::vector<std::string> ParseIpv4Addresses(const std::string &text);
}
