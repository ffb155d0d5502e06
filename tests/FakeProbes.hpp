#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include "common/Clock.hpp"
#include "monitor/DeviceProber.hpp"

// Hand-written doubles for the probe interfaces.
namespace lan_watch::testing
{
    using namespace std::chrono_literals;

    class ManualClock : public common::Clock
    {
    public:
        explicit ManualClock(common::Timestamp start = common::Timestamp(std::chrono::seconds(1700000000)))
            : m_now(start)
        {
        }

        common::Timestamp Now() const override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_now;
        }

        void Set(common::Timestamp now)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_now = now;
        }

        void Advance(std::chrono::milliseconds by)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_now += by;
        }

    private:
        mutable std::mutex m_mutex;
        common::Timestamp m_now;
    };

    // Hosts are up unless listed as down; listed stalls sleep before answering.
    class FakeReachability : public probes::ReachabilityProbe
    {
    public:
        common::ProbeResult<probes::EchoReply> Probe(const common::DeviceConfig &config,
                                                     std::chrono::milliseconds) override
        {
            ++calls;
            std::chrono::milliseconds stall{0};
            bool down = false;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                down = m_down.count(config.ip) > 0;
                auto it = m_stalls.find(config.ip);
                if (it != m_stalls.end())
                    stall = it->second;
            }
            if (stall.count() > 0)
                std::this_thread::sleep_for(stall);
            if (down)
                return common::ProbeResult<probes::EchoReply>::Failure(common::FailureKind::Unreachable, "down");
            return common::ProbeResult<probes::EchoReply>::Success(probes::EchoReply{});
        }

        void SetDown(const std::string &ip, bool down = true)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (down)
                m_down.insert(ip);
            else
                m_down.erase(ip);
        }

        void SetStall(const std::string &ip, std::chrono::milliseconds stall)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stalls[ip] = stall;
        }

        std::atomic<int> calls{0};

    private:
        std::mutex m_mutex;
        std::set<std::string> m_down;
        std::map<std::string, std::chrono::milliseconds> m_stalls;
    };

    class FakeNeighborStrategy : public probes::NeighborStrategy
    {
    public:
        explicit FakeNeighborStrategy(std::string mac, bool fail = false) : m_mac(std::move(mac)), m_fail(fail) {}

        const char *Name() const override { return "fake"; }

        common::ProbeResult<std::string> Resolve(const std::string &, std::chrono::milliseconds) override
        {
            ++calls;
            if (m_fail)
                return common::ProbeResult<std::string>::Failure(common::FailureKind::Timeout, "fake timeout");
            return common::ProbeResult<std::string>::Success(m_mac);
        }

        std::atomic<int> calls{0};

    private:
        std::string m_mac;
        bool m_fail;
    };

    inline std::shared_ptr<probes::NeighborResolver> ResolverReturning(const std::string &mac)
    {
        std::vector<std::unique_ptr<probes::NeighborStrategy>> chain;
        chain.push_back(std::make_unique<FakeNeighborStrategy>(mac));
        return std::make_shared<probes::NeighborResolver>(std::move(chain));
    }

    // Fixed answer, or a timeout when fail is set.
    class FakeHostnameResolver : public probes::HostnameResolver
    {
    public:
        explicit FakeHostnameResolver(std::string name, bool fail = false) : m_name(std::move(name)), m_fail(fail) {}

        common::ProbeResult<std::string> Resolve(const std::string &, std::chrono::milliseconds) override
        {
            ++calls;
            if (m_fail)
                return common::ProbeResult<std::string>::Failure(common::FailureKind::Timeout, "fake timeout");
            return common::ProbeResult<std::string>::Success(m_name);
        }

        std::atomic<int> calls{0};

    private:
        std::string m_name;
        bool m_fail;
    };

    class FakeSshProbe : public probes::SshMetricsProbe
    {
    public:
        explicit FakeSshProbe(common::ProbeResult<probes::SshReport> result) : m_result(std::move(result)) {}

        common::ProbeResult<probes::SshReport> Probe(const common::DeviceConfig &, std::chrono::milliseconds) override
        {
            ++calls;
            return m_result;
        }

        std::atomic<int> calls{0};

    private:
        common::ProbeResult<probes::SshReport> m_result;
    };

    class ThrowingSshProbe : public probes::SshMetricsProbe
    {
    public:
        common::ProbeResult<probes::SshReport> Probe(const common::DeviceConfig &, std::chrono::milliseconds) override
        {
            throw std::runtime_error("session exploded");
        }
    };

    class FakeGns3Probe : public probes::Gns3StatusProbe
    {
    public:
        explicit FakeGns3Probe(common::ProbeResult<common::Gns3Status> result) : m_result(std::move(result)) {}

        common::ProbeResult<common::Gns3Status> Probe(const common::DeviceConfig &, std::chrono::milliseconds) override
        {
            return m_result;
        }

    private:
        common::ProbeResult<common::Gns3Status> m_result;
    };

    inline std::shared_ptr<FakeGns3Probe> Gns3Unreachable()
    {
        return std::make_shared<FakeGns3Probe>(
            common::ProbeResult<common::Gns3Status>::Failure(common::FailureKind::ApiUnreachable, "no port"));
    }

    inline common::DeviceConfig MakeDevice(const std::string &id, const std::string &ip, const std::string &mac = "")
    {
        common::DeviceConfig config;
        config.id = id;
        config.name = id;
        config.ip = ip;
        config.mac = mac;
        return config;
    }

    inline common::DeviceConfig WithSsh(common::DeviceConfig config)
    {
        common::SshCredentials ssh;
        ssh.username = "mon";
        ssh.secret = "secret";
        config.ssh = ssh;
        return config;
    }
}
