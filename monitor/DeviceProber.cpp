#include "DeviceProber.hpp"
#include "../common/HttpClient.hpp"
#include "../common/SocketUtil.hpp"
#include <algorithm>
#include <future>
#include <iostream>

namespace lan_watch::monitor
{
    using common::ProbeResult;

    namespace
    {
        // A probe that throws counts as that probe failing.
        template <typename T>
        std::optional<T> Collect(std::future<ProbeResult<T>> &pending, const std::string &deviceId, const char *what,
                                 bool logFailure)
        {
            try
            {
                ProbeResult<T> result = pending.get();
                if (result)
                    return std::move(result.Value());
                if (logFailure)
                    std::cout << "[Prober] " << deviceId << " " << what << ": " << common::ToString(result.Kind())
                              << " (" << result.Error().message << ")\n";
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Prober] " << deviceId << " " << what << " probe threw: " << e.what() << "\n";
            }
            return std::nullopt;
        }
    }

    ProbeSet CreateDefaultProbes(const common::ProbeTimeouts &timeouts)
    {
        ProbeSet set;
        set.reachability = std::make_shared<probes::IcmpReachabilityProbe>();
        set.neighbors = probes::NeighborResolver::CreateDefault();
        set.hostnames = std::make_shared<probes::GetentHostnameResolver>();
        set.ssh = std::make_shared<probes::LibsshMetricsProbe>();
        set.gns3 = std::make_shared<probes::HttpGns3Probe>(std::make_shared<common::HttpClient>(),
                                                           common::TcpPortOpen, timeouts.port);
        return set;
    }

    DeviceProber::DeviceProber(ProbeSet probeSet, common::ProbeTimeouts timeouts, std::shared_ptr<common::Clock> clock)
        : m_probes(std::move(probeSet)), m_timeouts(timeouts), m_clock(std::move(clock))
    {
    }

    DeviceSnapshot DeviceProber::Probe(const common::DeviceConfig &config, const DeviceSnapshot *previous) const
    {
        // SSH and GNS3 run alongside the reachability -> neighbor chain.
        std::future<ProbeResult<probes::SshReport>> sshPending;
        if (config.ssh && m_probes.ssh)
        {
            sshPending = std::async(std::launch::async, [this, &config]()
                                    { return m_probes.ssh->Probe(config, m_timeouts.ssh); });
        }
        std::future<ProbeResult<common::Gns3Status>> gns3Pending;
        if (m_probes.gns3)
        {
            gns3Pending = std::async(std::launch::async, [this, &config]()
                                     { return m_probes.gns3->Probe(config, m_timeouts.gns3); });
        }

        bool reachable = false;
        try
        {
            reachable = m_probes.reachability && m_probes.reachability->Probe(config, m_timeouts.ping).IsSuccess();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Prober] " << config.id << " reachability probe threw: " << e.what() << "\n";
        }

        DeviceSnapshot snapshot;
        if (!reachable)
        {
            snapshot = UnreachableSnapshot(config, previous, m_clock->Now());
        }
        else
        {
            const common::Timestamp now = m_clock->Now();
            snapshot = SeedSnapshot(config);
            if (previous)
            {
                snapshot.mac = previous->mac;
                snapshot.hostname = previous->hostname;
                snapshot.ips = previous->ips;
            }
            snapshot.up = true;
            snapshot.last_seen = (previous && previous->last_seen) ? std::max(now, *previous->last_seen) : now;

            std::future<common::ProbeResult<std::string>> namePending;
            if (m_probes.hostnames)
            {
                namePending = std::async(std::launch::async, [this, &config]()
                                         { return m_probes.hostnames->Resolve(config.ip, m_timeouts.hostname); });
            }

            if (m_probes.neighbors)
            {
                try
                {
                    auto mac = m_probes.neighbors->Resolve(config.ip, m_timeouts.neighbor);
                    if (mac && !mac.Value().empty())
                        snapshot.mac = mac.Value();
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Prober] " << config.id << " neighbor resolution threw: " << e.what() << "\n";
                }
            }
            MergeIps(snapshot.ips, {config.ip});

            if (namePending.valid())
            {
                auto name = Collect(namePending, config.id, "hostname", false);
                if (name && !name->empty())
                    snapshot.hostname = *name;
            }
        }

        if (sshPending.valid())
        {
            if (auto report = Collect(sshPending, config.id, "ssh", true))
            {
                snapshot.ssh_metrics = common::Sanitized(report->metrics);
                if (snapshot.up)
                    MergeIps(snapshot.ips, report->addresses);
            }
        }
        if (gns3Pending.valid())
        {
            if (auto status = Collect(gns3Pending, config.id, "gns3", config.gns3.has_value()))
                snapshot.gns3_status = common::Sanitized(*status);
        }

        snapshot.last_checked = m_clock->Now();
        return snapshot;
    }
}
