#pragma once

#include <memory>
#include <optional>
#include <string>
#include "Snapshot.hpp"

namespace lan_watch::monitor
{
    // Holds the latest published fleet snapshot. Readers get a shared,
    // immutable snapshot; Publish() swaps the pointer atomically.
    class StateStore
    {
    public:
        explicit StateStore(FleetSnapshot seed);

        std::shared_ptr<const FleetSnapshot> Read() const;
        void Publish(std::shared_ptr<const FleetSnapshot> snapshot);

        std::optional<Timestamp> LastSeen(const std::string &deviceId) const;

    private:
        std::shared_ptr<const FleetSnapshot> m_current;
    };
}
