#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lan_watch::common
{
    struct SshCredentials
    {
        std::string host; // empty means the device's primary ip
        uint16_t port = 22;
        std::string username;
        std::string secret;
    };

    struct Gns3Endpoint
    {
        std::string base_url;
        std::string token;
        std::string token_type = "bearer";

        bool HasToken() const { return !token.empty(); }
    };

    struct DeviceConfig
    {
        std::string id;
        std::string name;
        std::string ip;
        std::string mac;
        std::string broadcast;
        std::optional<SshCredentials> ssh;
        std::optional<Gns3Endpoint> gns3;

        const std::string &SshHost() const
        {
            return (ssh && !ssh->host.empty()) ? ssh->host : ip;
        }
    };

    struct ProbeTimeouts
    {
        std::chrono::milliseconds ping{1000};
        std::chrono::milliseconds neighbor{1000};
        std::chrono::milliseconds hostname{1000};
        std::chrono::milliseconds ssh{2000};
        std::chrono::milliseconds gns3{1500};
        std::chrono::milliseconds port{400};
    };

    struct AppConfig
    {
        std::vector<DeviceConfig> devices;
        int scan_interval_seconds = 30;
        int cycle_deadline_seconds = 30;
        int max_concurrency = 16;
        ProbeTimeouts timeouts;
    };
}
