#include "Snapshot.hpp"
#include <algorithm>
#include <cctype>

namespace lan_watch::monitor
{
    std::string LowercaseMac(std::string mac)
    {
        std::transform(mac.begin(), mac.end(), mac.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return mac;
    }

    const DeviceSnapshot *FleetSnapshot::Find(const std::string &id) const
    {
        auto it = std::find_if(devices.begin(), devices.end(),
                               [&id](const DeviceSnapshot &d) { return d.id == id; });
        return it == devices.end() ? nullptr : &*it;
    }

    void MergeIps(std::vector<std::string> &ips, const std::vector<std::string> &discovered)
    {
        for (const auto &ip : discovered)
        {
            if (ip.empty())
                continue;
            if (std::find(ips.begin(), ips.end(), ip) == ips.end())
                ips.push_back(ip);
        }
    }

    DeviceSnapshot SeedSnapshot(const common::DeviceConfig &config)
    {
        DeviceSnapshot snapshot;
        snapshot.id = config.id;
        snapshot.name = config.name;
        snapshot.ip = config.ip;
        if (!config.mac.empty())
            snapshot.mac = LowercaseMac(config.mac);
        MergeIps(snapshot.ips, {config.ip});
        return snapshot;
    }

    FleetSnapshot SeedFleet(const std::vector<common::DeviceConfig> &configs, int scanIntervalSeconds, Timestamp now)
    {
        FleetSnapshot fleet;
        fleet.generated_at = now;
        fleet.scan_interval_seconds = scanIntervalSeconds;
        fleet.devices.reserve(configs.size());
        for (const auto &config : configs)
        {
            DeviceSnapshot seed = SeedSnapshot(config);
            seed.last_checked = now;
            fleet.devices.push_back(std::move(seed));
        }
        return fleet;
    }

    DeviceSnapshot UnreachableSnapshot(const common::DeviceConfig &config, const DeviceSnapshot *previous, Timestamp now)
    {
        DeviceSnapshot snapshot = SeedSnapshot(config);
        if (previous)
        {
            snapshot.last_seen = previous->last_seen;
            snapshot.mac = previous->mac;
            snapshot.hostname = previous->hostname;
            snapshot.ips = previous->ips;
        }
        snapshot.up = false;
        snapshot.last_checked = now;
        return snapshot;
    }
}
