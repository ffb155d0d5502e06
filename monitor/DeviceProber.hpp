#pragma once

#include <memory>
#include "Snapshot.hpp"
#include "../common/Clock.hpp"
#include "../common/DeviceConfig.hpp"
#include "../probes/Gns3StatusProbe.hpp"
#include "../probes/HostnameResolver.hpp"
#include "../probes/NeighborResolver.hpp"
#include "../probes/ReachabilityProbe.hpp"
#include "../probes/SshMetricsProbe.hpp"

namespace lan_watch::monitor
{
    struct ProbeSet
    {
        std::shared_ptr<probes::ReachabilityProbe> reachability;
        std::shared_ptr<probes::NeighborResolver> neighbors;
        std::shared_ptr<probes::HostnameResolver> hostnames;
        std::shared_ptr<probes::SshMetricsProbe> ssh;
        std::shared_ptr<probes::Gns3StatusProbe> gns3;
    };

    // ICMP, neighbor tables, getent, libssh and the HTTP client wired together.
    ProbeSet CreateDefaultProbes(const common::ProbeTimeouts &timeouts);

    // Folds the probe results for one device into its next snapshot.
    class DeviceProber
    {
    public:
        DeviceProber(ProbeSet probeSet, common::ProbeTimeouts timeouts, std::shared_ptr<common::Clock> clock);

        // Never throws for probe failures; previous may be null.
        DeviceSnapshot Probe(const common::DeviceConfig &config, const DeviceSnapshot *previous) const;

    private:
        ProbeSet m_probes;
        common::ProbeTimeouts m_timeouts;
        std::shared_ptr<common::Clock> m_clock;
    };
}
