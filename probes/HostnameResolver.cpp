#include "HostnameResolver.hpp"
#include "../common/CommandRunner.hpp"
#include <sstream>

namespace lan_watch::probes
{
    using common::FailureKind;
    using common::ProbeResult;

    namespace
    {
        // getent exits 2 when the key is not found.
        constexpr int GETENT_NOT_FOUND = 2;
    }

    std::string ParseGetentHosts(const std::string &output, const std::string &ip)
    {
        std::istringstream lines(output);
        std::string line;
        while (std::getline(lines, line))
        {
            std::istringstream ss(line);
            std::string address, name;
            if (!(ss >> address >> name))
                continue;
            if (address == ip)
                return name;
        }
        return "";
    }

    ProbeResult<std::string> GetentHostnameResolver::Resolve(const std::string &ip, std::chrono::milliseconds timeout)
    {
        auto run = common::RunCommand({"getent", "hosts", ip}, timeout);
        if (!run)
            return ProbeResult<std::string>::Failure(run.Kind(), run.Error().message);

        const common::CommandOutput &out = run.Value();
        if (out.exit_code == GETENT_NOT_FOUND)
            return ProbeResult<std::string>::Success("");
        if (out.exit_code != 0)
            return ProbeResult<std::string>::Failure(FailureKind::ProbeError,
                                                     "getent exited with " + std::to_string(out.exit_code));
        return ProbeResult<std::string>::Success(ParseGetentHosts(out.output, ip));
    }
}
