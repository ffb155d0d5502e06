#pragma once

#include <nlohmann/json.hpp>
#include "Snapshot.hpp"
#include "../probes/Gns3Installation.hpp"

namespace lan_watch::monitor
{
    // Status document: timestamps are epoch seconds, absent values are null.
    nlohmann::json ToJson(const DeviceSnapshot &device);
    nlohmann::json ToJson(const FleetSnapshot &fleet);
    nlohmann::json ToJson(const probes::Gns3Installation &installation);

    // The fleet document plus the local GNS3 installation under "gns3".
    nlohmann::json StatusDocument(const FleetSnapshot &fleet, const probes::Gns3Installation &installation);
}
