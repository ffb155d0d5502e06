#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace lan_watch::probes
{
    // GNS3 binaries present on this machine.
    struct Gns3Installation
    {
        bool installed = false;
        std::map<std::string, bool> found;           // every checked binary
        std::map<std::string, std::string> versions; // found binaries only
    };

    // First executable `name` in the colon-separated directory list.
    std::optional<std::string> FindExecutable(const std::string &name, const std::string &searchPath);

    // Looks for gns3, gns3server and gns3-gui and asks each one found for its
    // version. searchPath defaults to $PATH.
    Gns3Installation CheckGns3Installation(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000),
                                           const std::optional<std::string> &searchPath = std::nullopt);
}
