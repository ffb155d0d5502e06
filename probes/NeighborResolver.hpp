#pragma once

#include <chrono>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "../common/ProbeResult.hpp"

namespace lan_watch::probes
{
    // First "xx:xx:xx:xx:xx:xx" token in text, lowercased; empty if none or all-zero.
    std::string ExtractMac(const std::string &text);

    // Looks ip up in /proc/net/arp formatted content.
    std::string LookupArpTable(std::istream &table, const std::string &ip);

    class NeighborStrategy
    {
    public:
        virtual ~NeighborStrategy() = default;
        virtual const char *Name() const = 0;

        // Success with an empty string means "no entry".
        virtual common::ProbeResult<std::string> Resolve(const std::string &ip,
                                                         std::chrono::milliseconds timeout) = 0;
    };

    // `ip -o neigh show <ip>`
    class NeighborTableStrategy : public NeighborStrategy
    {
    public:
        const char *Name() const override { return "ip-neigh"; }
        common::ProbeResult<std::string> Resolve(const std::string &ip, std::chrono::milliseconds timeout) override;
    };

    // `arp -n <ip>`
    class ArpCommandStrategy : public NeighborStrategy
    {
    public:
        const char *Name() const override { return "arp"; }
        common::ProbeResult<std::string> Resolve(const std::string &ip, std::chrono::milliseconds timeout) override;
    };

    class ArpTableStrategy : public NeighborStrategy
    {
    public:
        explicit ArpTableStrategy(std::string path = "/proc/net/arp") : m_path(std::move(path)) {}

        const char *Name() const override { return "proc-arp"; }
        common::ProbeResult<std::string> Resolve(const std::string &ip, std::chrono::milliseconds timeout) override;

    private:
        std::string m_path;
    };

    // Tries each strategy in order until one returns a non-empty MAC.
    class NeighborResolver
    {
    public:
        explicit NeighborResolver(std::vector<std::unique_ptr<NeighborStrategy>> strategies);

        // neigh table, arp command, /proc/net/arp
        static std::unique_ptr<NeighborResolver> CreateDefault();

        // Never fails: an exhausted chain yields an empty MAC.
        common::ProbeResult<std::string> Resolve(const std::string &ip, std::chrono::milliseconds timeout) const;

    private:
        std::vector<std::unique_ptr<NeighborStrategy>> m_strategies;
    };
}
