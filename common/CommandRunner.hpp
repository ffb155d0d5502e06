#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "ProbeResult.hpp"

namespace lan_watch::common
{
    struct CommandOutput
    {
        int exit_code = -1;
        std::string output; // stdout only
    };

    // Runs argv[0] (PATH lookup) with stdout captured and stderr discarded.
    // The child is killed and reaped if it outlives the timeout.
    // Failure kinds: ProbeError (pipe/fork), Timeout.
    ProbeResult<CommandOutput> RunCommand(const std::vector<std::string> &argv,
                                          std::chrono::milliseconds timeout);
}
