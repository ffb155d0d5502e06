#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "../common/DeviceConfig.hpp"
#include "../common/ProbeResult.hpp"
#include "../common/Telemetry.hpp"

namespace lan_watch::probes
{
    struct SshReport
    {
        common::SshMetrics metrics;
        std::vector<std::string> addresses; // IPv4 addresses the host reports for itself
    };

    // One established session able to run shell commands.
    class RemoteShell
    {
    public:
        virtual ~RemoteShell() = default;

        // stdout of the command, nullopt if it could not be run or timed out.
        virtual std::optional<std::string> Run(const std::string &command) = 0;
    };

    // Refuses further commands once the deadline has passed.
    class DeadlineShell : public RemoteShell
    {
    public:
        DeadlineShell(RemoteShell &inner, std::chrono::steady_clock::time_point deadline)
            : m_inner(inner), m_deadline(deadline)
        {
        }

        std::optional<std::string> Run(const std::string &command) override;

    private:
        RemoteShell &m_inner;
        std::chrono::steady_clock::time_point m_deadline;
    };

    // Runs the introspection commands through shell and parses what comes back.
    // ParseError when no metric could be extracted at all.
    common::ProbeResult<SshReport> CollectMetrics(RemoteShell &shell, const std::string &monitorUser);

    class SshMetricsProbe
    {
    public:
        virtual ~SshMetricsProbe() = default;

        // Failure kinds: AuthFailed, ConnectTimeout, ParseError.
        virtual common::ProbeResult<SshReport> Probe(const common::DeviceConfig &config,
                                                     std::chrono::milliseconds timeout) = 0;
    };

    // Password login with libssh. Host keys are accepted without verification.
    // Connect, login and every command share one timeout.
    class LibsshMetricsProbe : public SshMetricsProbe
    {
    public:
        common::ProbeResult<SshReport> Probe(const common::DeviceConfig &config,
                                             std::chrono::milliseconds timeout) override;
    };
}
