#include "ReachabilityProbe.hpp"
#include <tins/tins.h>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace lan_watch::probes
{
    using common::FailureKind;
    using common::ProbeResult;

    IcmpReachabilityProbe::IcmpReachabilityProbe()
        : m_nextId(static_cast<uint16_t>(getpid() & 0xFFFF)), m_permissionReported(false)
    {
    }

    void IcmpReachabilityProbe::ReportPermissionProblem(const char *what)
    {
        if (m_permissionReported.exchange(true))
            return;
        std::cerr << "[Reachability] Cannot open raw ICMP socket (" << what
                  << "). Run as root or grant CAP_NET_RAW; every device will report down.\n";
    }

    ProbeResult<EchoReply> IcmpReachabilityProbe::Probe(const common::DeviceConfig &config,
                                                        std::chrono::milliseconds timeout)
    {
        try
        {
            Tins::IPv4Address target(config.ip);
            Tins::NetworkInterface iface(target);

            const auto ms = static_cast<uint32_t>(timeout.count());
            Tins::PacketSender sender(iface, ms / 1000, (ms % 1000) * 1000);

            Tins::IP packet = Tins::IP(target) / Tins::ICMP();
            Tins::ICMP &icmp = packet.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(m_nextId.fetch_add(1));
            icmp.sequence(1);

            auto start = std::chrono::steady_clock::now();
            std::unique_ptr<Tins::PDU> reply(sender.send_recv(packet));
            auto end = std::chrono::steady_clock::now();

            if (!reply)
                return ProbeResult<EchoReply>::Failure(FailureKind::Unreachable, "no echo reply from " + config.ip);

            EchoReply echo;
            echo.round_trip = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
            return ProbeResult<EchoReply>::Success(echo);
        }
        catch (const Tins::socket_open_error &e)
        {
            ReportPermissionProblem(e.what());
            return ProbeResult<EchoReply>::Failure(FailureKind::ProbeError, e.what());
        }
        catch (const Tins::socket_write_error &e)
        {
            // EHOSTUNREACH and friends surface here.
            return ProbeResult<EchoReply>::Failure(FailureKind::Unreachable, e.what());
        }
        catch (const std::exception &e)
        {
            return ProbeResult<EchoReply>::Failure(FailureKind::ProbeError, e.what());
        }
    }
}
