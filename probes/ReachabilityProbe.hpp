#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include "../common/DeviceConfig.hpp"
#include "../common/ProbeResult.hpp"

namespace lan_watch::probes
{
    struct EchoReply
    {
        std::chrono::microseconds round_trip{0};
    };

    class ReachabilityProbe
    {
    public:
        virtual ~ReachabilityProbe() = default;

        // Failure kinds: Unreachable (no reply in time), ProbeError (socket/permission).
        virtual common::ProbeResult<EchoReply> Probe(const common::DeviceConfig &config,
                                                     std::chrono::milliseconds timeout) = 0;
    };

    // One ICMP echo request through a libtins raw socket. Needs root or CAP_NET_RAW.
    class IcmpReachabilityProbe : public ReachabilityProbe
    {
    public:
        IcmpReachabilityProbe();

        common::ProbeResult<EchoReply> Probe(const common::DeviceConfig &config,
                                             std::chrono::milliseconds timeout) override;

    private:
        void ReportPermissionProblem(const char *what);

        std::atomic<uint16_t> m_nextId;
        std::atomic<bool> m_permissionReported;
    };
}
