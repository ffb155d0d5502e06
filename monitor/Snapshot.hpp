#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../common/Clock.hpp"
#include "../common/DeviceConfig.hpp"
#include "../common/Telemetry.hpp"

namespace lan_watch::monitor
{
    using common::Timestamp;

    struct DeviceSnapshot
    {
        std::string id;
        std::string name;
        std::string ip;
        bool up = false;
        std::optional<Timestamp> last_seen;
        Timestamp last_checked{};
        std::optional<std::string> mac;
        std::optional<std::string> hostname;
        std::vector<std::string> ips; // discovery order, no duplicates
        std::optional<common::SshMetrics> ssh_metrics;
        std::optional<common::Gns3Status> gns3_status;
    };

    struct FleetSnapshot
    {
        Timestamp generated_at{};
        uint64_t cycle = 0;
        int scan_interval_seconds = 0;
        std::vector<DeviceSnapshot> devices; // configuration order

        const DeviceSnapshot *Find(const std::string &id) const;
    };

    // Snapshots hold MACs in the lowercase form the neighbor tables use.
    std::string LowercaseMac(std::string mac);

    // Appends the addresses not already present, keeping existing order.
    void MergeIps(std::vector<std::string> &ips, const std::vector<std::string> &discovered);

    // State of a device that has never been probed: down, config MAC, primary ip.
    DeviceSnapshot SeedSnapshot(const common::DeviceConfig &config);

    FleetSnapshot SeedFleet(const std::vector<common::DeviceConfig> &configs, int scanIntervalSeconds, Timestamp now);

    // Down snapshot keeping identity fields of previous (or the seed values).
    DeviceSnapshot UnreachableSnapshot(const common::DeviceConfig &config, const DeviceSnapshot *previous, Timestamp now);
}
