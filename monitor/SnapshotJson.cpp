#include "SnapshotJson.hpp"

namespace lan_watch::monitor
{
    using json = nlohmann::json;

    namespace
    {
        template <typename T>
        json OrNull(const std::optional<T> &value)
        {
            return value ? json(*value) : json(nullptr);
        }

        json ToJson(const common::SshMetrics &metrics)
        {
            return json{{"users_active", OrNull(metrics.users_active)},
                        {"cpu_percent", OrNull(metrics.cpu_percent)},
                        {"mem_percent", OrNull(metrics.mem_percent)},
                        {"disk_percent", OrNull(metrics.disk_percent)}};
        }

        json ToJson(const common::Gns3Status &status)
        {
            return json{{"active", status.active},
                        {"api_ok", status.api_ok},
                        {"projects_open", status.projects_open},
                        {"cpu_percent", OrNull(status.cpu_percent)},
                        {"mem_percent", OrNull(status.mem_percent)},
                        {"url", status.url},
                        {"port", OrNull(status.port)}};
        }
    }

    json ToJson(const DeviceSnapshot &device)
    {
        json out;
        out["id"] = device.id;
        out["name"] = device.name;
        out["ip"] = device.ip;
        out["up"] = device.up;
        out["last_seen"] = device.last_seen ? json(common::ToEpochSeconds(*device.last_seen)) : json(nullptr);
        out["last_checked"] = common::ToEpochSeconds(device.last_checked);
        out["mac"] = OrNull(device.mac);
        out["hostname"] = OrNull(device.hostname);
        out["ips"] = device.ips;
        out["ssh_metrics"] = device.ssh_metrics ? ToJson(*device.ssh_metrics) : json(nullptr);
        out["gns3_status"] = device.gns3_status ? ToJson(*device.gns3_status) : json(nullptr);
        return out;
    }

    json ToJson(const FleetSnapshot &fleet)
    {
        json devices = json::array();
        for (const auto &device : fleet.devices)
            devices.push_back(ToJson(device));

        return json{{"generated", common::ToEpochSeconds(fleet.generated_at)},
                    {"scan_interval", fleet.scan_interval_seconds},
                    {"cycle", fleet.cycle},
                    {"devices", std::move(devices)}};
    }

    json ToJson(const probes::Gns3Installation &installation)
    {
        return json{{"installed", installation.installed},
                    {"found", installation.found},
                    {"versions", installation.versions}};
    }

    json StatusDocument(const FleetSnapshot &fleet, const probes::Gns3Installation &installation)
    {
        json doc = ToJson(fleet);
        doc["gns3"] = ToJson(installation);
        return doc;
    }
}
