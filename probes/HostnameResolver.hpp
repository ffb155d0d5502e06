#pragma once

#include <chrono>
#include <string>
#include "../common/ProbeResult.hpp"

namespace lan_watch::probes
{
    // Canonical name from one `getent hosts` line ("<ip> <name> [aliases]"); empty if none.
    std::string ParseGetentHosts(const std::string &output, const std::string &ip);

    class HostnameResolver
    {
    public:
        virtual ~HostnameResolver() = default;

        // Success with an empty string means the address has no name.
        virtual common::ProbeResult<std::string> Resolve(const std::string &ip,
                                                         std::chrono::milliseconds timeout) = 0;
    };

    // Reverse lookup through `getent hosts <ip>`, so NSS (hosts file, DNS,
    // mDNS) answers and the lookup can be killed at the timeout.
    class GetentHostnameResolver : public HostnameResolver
    {
    public:
        common::ProbeResult<std::string> Resolve(const std::string &ip, std::chrono::milliseconds timeout) override;
    };
}
