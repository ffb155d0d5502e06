#include "SshMetricsProbe.hpp"
#include "MetricsParser.hpp"
#include <algorithm>
#include <libssh/libssh.h>

namespace lan_watch::probes
{
    using common::FailureKind;
    using common::ProbeResult;

    namespace
    {
        using SteadyClock = std::chrono::steady_clock;

        constexpr const char *CMD_WHO = "who";
        constexpr const char *CMD_UPTIME = "uptime";
        constexpr const char *CMD_CPU = "grep '^cpu ' /proc/stat; sleep 0.4; grep '^cpu ' /proc/stat";
        constexpr const char *CMD_MEM = "cat /proc/meminfo";
        constexpr const char *CMD_DISK = "df -P /";
        constexpr const char *CMD_ADDR = "ip -4 -o addr show scope global 2>/dev/null || hostname -I";

        class LibsshSession : public RemoteShell
        {
        public:
            LibsshSession() : m_session(ssh_new()), m_connected(false) {}

            ~LibsshSession() override
            {
                if (!m_session)
                    return;
                if (m_connected)
                    ssh_disconnect(m_session);
                ssh_free(m_session);
            }

            LibsshSession(const LibsshSession &) = delete;
            LibsshSession &operator=(const LibsshSession &) = delete;

            ProbeResult<bool> Open(const common::DeviceConfig &config, SteadyClock::time_point deadline)
            {
                if (!m_session)
                    return ProbeResult<bool>::Failure(FailureKind::ConnectTimeout, "ssh_new failed");
                m_deadline = deadline;

                const common::SshCredentials &creds = *config.ssh;
                const std::string &host = config.SshHost();
                unsigned int port = creds.port;
                int strict = 0;

                ssh_options_set(m_session, SSH_OPTIONS_HOST, host.c_str());
                ssh_options_set(m_session, SSH_OPTIONS_PORT, &port);
                ssh_options_set(m_session, SSH_OPTIONS_USER, creds.username.c_str());
                ssh_options_set(m_session, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);
                if (!ApplyRemainingTimeout())
                    return ProbeResult<bool>::Failure(FailureKind::ConnectTimeout, "no time left to connect");

                if (ssh_connect(m_session) != SSH_OK)
                    return ProbeResult<bool>::Failure(FailureKind::ConnectTimeout,
                                                      std::string("connect: ") + ssh_get_error(m_session));
                m_connected = true;

                // Login gets what the handshake left over.
                if (!ApplyRemainingTimeout())
                    return ProbeResult<bool>::Failure(FailureKind::ConnectTimeout, "timed out after the handshake");

                int rc = ssh_userauth_password(m_session, nullptr, creds.secret.c_str());
                if (rc == SSH_AUTH_SUCCESS)
                    return ProbeResult<bool>::Success(true);
                if (rc == SSH_AUTH_DENIED || rc == SSH_AUTH_PARTIAL)
                    return ProbeResult<bool>::Failure(FailureKind::AuthFailed, "password rejected for " + creds.username);
                return ProbeResult<bool>::Failure(FailureKind::ConnectTimeout,
                                                  std::string("auth: ") + ssh_get_error(m_session));
            }

            std::optional<std::string> Run(const std::string &command) override
            {
                ssh_channel channel = ssh_channel_new(m_session);
                if (!channel)
                    return std::nullopt;

                std::optional<std::string> output;
                if (ssh_channel_open_session(channel) == SSH_OK)
                {
                    if (ssh_channel_request_exec(channel, command.c_str()) == SSH_OK)
                        output = ReadAll(channel);
                    ssh_channel_send_eof(channel);
                    ssh_channel_close(channel);
                }
                ssh_channel_free(channel);
                return output;
            }

        private:
            // Blocking libssh calls are bounded by the session timeout.
            bool ApplyRemainingTimeout()
            {
                auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(m_deadline - SteadyClock::now());
                if (remaining.count() <= 0)
                    return false;
                long seconds = static_cast<long>(remaining.count() / 1000000);
                long usec = static_cast<long>(remaining.count() % 1000000);
                ssh_options_set(m_session, SSH_OPTIONS_TIMEOUT, &seconds);
                ssh_options_set(m_session, SSH_OPTIONS_TIMEOUT_USEC, &usec);
                return true;
            }

            std::optional<std::string> ReadAll(ssh_channel channel)
            {
                std::string output;
                char buffer[4096];
                while (true)
                {
                    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                        m_deadline - SteadyClock::now());
                    if (remaining.count() <= 0)
                        return std::nullopt;

                    int n = ssh_channel_read_timeout(channel, buffer, sizeof(buffer), 0,
                                                     static_cast<int>(remaining.count()));
                    if (n > 0)
                    {
                        output.append(buffer, static_cast<size_t>(n));
                        continue;
                    }
                    if (n == SSH_ERROR)
                        return std::nullopt;
                    if (ssh_channel_is_eof(channel))
                        return output;
                }
            }

            ssh_session m_session;
            bool m_connected;
            SteadyClock::time_point m_deadline{};
        };
    }

    std::optional<std::string> DeadlineShell::Run(const std::string &command)
    {
        if (SteadyClock::now() >= m_deadline)
            return std::nullopt;
        return m_inner.Run(command);
    }

    ProbeResult<SshReport> CollectMetrics(RemoteShell &shell, const std::string &monitorUser)
    {
        SshReport report;
        common::SshMetrics &metrics = report.metrics;

        auto who = shell.Run(CMD_WHO);
        if (who)
            metrics.users_active = ParseWhoSessions(*who, monitorUser);
        if (!metrics.users_active)
        {
            // who listed nobody or failed: fall back to the uptime count, minus our own logins
            if (auto uptime = shell.Run(CMD_UPTIME))
            {
                if (auto users = ParseUptimeUsers(*uptime))
                {
                    int own = who ? CountUserSessions(*who, monitorUser) : 0;
                    metrics.users_active = std::max(0, *users - own);
                }
            }
        }

        if (auto cpu = shell.Run(CMD_CPU))
            metrics.cpu_percent = ParseCpuSamples(*cpu);
        if (auto mem = shell.Run(CMD_MEM))
            metrics.mem_percent = ParseMemInfo(*mem);
        if (auto disk = shell.Run(CMD_DISK))
            metrics.disk_percent = ParseDiskUsage(*disk);
        if (auto addr = shell.Run(CMD_ADDR))
            report.addresses = ParseIpv4Addresses(*addr);

        metrics = common::Sanitized(metrics);
        if (metrics.Empty())
            return ProbeResult<SshReport>::Failure(FailureKind::ParseError, "no metric could be parsed");
        return ProbeResult<SshReport>::Success(std::move(report));
    }

    ProbeResult<SshReport> LibsshMetricsProbe::Probe(const common::DeviceConfig &config,
                                                     std::chrono::milliseconds timeout)
    {
        if (!config.ssh)
            return ProbeResult<SshReport>::Failure(FailureKind::ConnectTimeout, "no ssh credentials configured");

        const auto deadline = SteadyClock::now() + timeout;

        LibsshSession session;
        auto opened = session.Open(config, deadline);
        if (!opened)
            return ProbeResult<SshReport>::Failure(opened.Kind(), opened.Error().message);

        DeadlineShell shell(session, deadline);
        return CollectMetrics(shell, config.ssh->username);
    }
}
