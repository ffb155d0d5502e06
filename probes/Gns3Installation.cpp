#include "Gns3Installation.hpp"
#include "../common/CommandRunner.hpp"
#include <cstdlib>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace lan_watch::probes
{
    namespace
    {
        const char *const GNS3_BINARIES[] = {"gns3", "gns3server", "gns3-gui"};
        constexpr const char *UNKNOWN_VERSION = "installed (version unknown)";

        std::string FirstLine(const std::string &text)
        {
            std::istringstream lines(text);
            std::string line;
            while (std::getline(lines, line))
            {
                size_t b = line.find_first_not_of(" \t\r");
                if (b == std::string::npos)
                    continue;
                size_t e = line.find_last_not_of(" \t\r");
                return line.substr(b, e - b + 1);
            }
            return "";
        }

        std::string VersionOf(const std::string &executable, std::chrono::milliseconds timeout)
        {
            auto run = common::RunCommand({executable, "--version"}, timeout);
            if (!run)
                return UNKNOWN_VERSION;
            std::string line = FirstLine(run.Value().output);
            return line.empty() ? UNKNOWN_VERSION : line;
        }
    }

    std::optional<std::string> FindExecutable(const std::string &name, const std::string &searchPath)
    {
        std::istringstream dirs(searchPath);
        std::string dir;
        while (std::getline(dirs, dir, ':'))
        {
            if (dir.empty())
                dir = ".";
            std::string candidate = dir + "/" + name;
            struct stat st{};
            if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0)
                return candidate;
        }
        return std::nullopt;
    }

    Gns3Installation CheckGns3Installation(std::chrono::milliseconds timeout, const std::optional<std::string> &searchPath)
    {
        std::string path;
        if (searchPath)
            path = *searchPath;
        else if (const char *env = std::getenv("PATH"))
            path = env;

        Gns3Installation result;
        for (const char *binary : GNS3_BINARIES)
        {
            auto executable = FindExecutable(binary, path);
            result.found[binary] = executable.has_value();
            if (!executable)
                continue;
            result.installed = true;
            result.versions[binary] = VersionOf(*executable, timeout);
        }
        return result;
    }
}
