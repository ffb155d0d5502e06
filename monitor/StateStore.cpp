#include "StateStore.hpp"
#include <stdexcept>

namespace lan_watch::monitor
{
    StateStore::StateStore(FleetSnapshot seed)
        : m_current(std::make_shared<const FleetSnapshot>(std::move(seed)))
    {
    }

    std::shared_ptr<const FleetSnapshot> StateStore::Read() const
    {
        return std::atomic_load(&m_current);
    }

    void StateStore::Publish(std::shared_ptr<const FleetSnapshot> snapshot)
    {
        if (!snapshot)
            throw std::invalid_argument("StateStore::Publish: null snapshot");
        std::atomic_store(&m_current, std::move(snapshot));
    }

    std::optional<Timestamp> StateStore::LastSeen(const std::string &deviceId) const
    {
        auto snapshot = Read();
        const DeviceSnapshot *device = snapshot->Find(deviceId);
        if (!device)
            return std::nullopt;
        return device->last_seen;
    }
}
