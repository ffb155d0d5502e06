#include "NeighborResolver.hpp"
#include "../common/CommandRunner.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace lan_watch::probes
{
    using common::FailureKind;
    using common::ProbeResult;

    namespace
    {
        constexpr const char *ZERO_MAC = "00:00:00:00:00:00";

        bool LooksLikeMac(const std::string &token)
        {
            if (token.size() != 17)
                return false;
            for (size_t i = 0; i < token.size(); ++i)
            {
                if (i % 3 == 2)
                {
                    if (token[i] != ':')
                        return false;
                }
                else if (!std::isxdigit(static_cast<unsigned char>(token[i])))
                {
                    return false;
                }
            }
            return true;
        }

        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        ProbeResult<std::string> MacFromCommand(const std::vector<std::string> &argv, std::chrono::milliseconds timeout)
        {
            auto run = common::RunCommand(argv, timeout);
            if (!run)
                return ProbeResult<std::string>::Failure(run.Kind(), run.Error().message);
            if (run.Value().exit_code != 0)
                return ProbeResult<std::string>::Failure(FailureKind::ProbeError,
                                                         argv[0] + " exited with " + std::to_string(run.Value().exit_code));
            return ProbeResult<std::string>::Success(ExtractMac(run.Value().output));
        }
    }

    std::string ExtractMac(const std::string &text)
    {
        std::istringstream ss(text);
        std::string token;
        while (ss >> token)
        {
            if (!LooksLikeMac(token))
                continue;
            std::string mac = Lower(token);
            if (mac != ZERO_MAC)
                return mac;
        }
        return "";
    }

    std::string LookupArpTable(std::istream &table, const std::string &ip)
    {
        std::string line;
        std::getline(table, line); // header
        while (std::getline(table, line))
        {
            std::stringstream ss(line);
            std::string entryIp, hwType, flags, mac;
            ss >> entryIp >> hwType >> flags >> mac;

            if (entryIp != ip)
                continue;
            mac = Lower(mac);
            if (LooksLikeMac(mac) && mac != ZERO_MAC)
                return mac;
        }
        return "";
    }

    ProbeResult<std::string> NeighborTableStrategy::Resolve(const std::string &ip, std::chrono::milliseconds timeout)
    {
        return MacFromCommand({"ip", "-o", "neigh", "show", ip}, timeout);
    }

    ProbeResult<std::string> ArpCommandStrategy::Resolve(const std::string &ip, std::chrono::milliseconds timeout)
    {
        return MacFromCommand({"arp", "-n", ip}, timeout);
    }

    ProbeResult<std::string> ArpTableStrategy::Resolve(const std::string &ip, std::chrono::milliseconds)
    {
        std::ifstream arpFile(m_path);
        if (!arpFile.is_open())
            return ProbeResult<std::string>::Failure(FailureKind::ProbeError, "cannot open " + m_path);
        return ProbeResult<std::string>::Success(LookupArpTable(arpFile, ip));
    }

    NeighborResolver::NeighborResolver(std::vector<std::unique_ptr<NeighborStrategy>> strategies)
        : m_strategies(std::move(strategies))
    {
    }

    std::unique_ptr<NeighborResolver> NeighborResolver::CreateDefault()
    {
        std::vector<std::unique_ptr<NeighborStrategy>> chain;
        chain.push_back(std::make_unique<NeighborTableStrategy>());
        chain.push_back(std::make_unique<ArpCommandStrategy>());
        chain.push_back(std::make_unique<ArpTableStrategy>());
        return std::make_unique<NeighborResolver>(std::move(chain));
    }

    ProbeResult<std::string> NeighborResolver::Resolve(const std::string &ip, std::chrono::milliseconds timeout) const
    {
        for (const auto &strategy : m_strategies)
        {
            auto result = strategy->Resolve(ip, timeout);
            if (result && !result.Value().empty())
                return result;
        }
        return ProbeResult<std::string>::Success("");
    }
}
