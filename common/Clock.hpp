#pragma once

#include <chrono>

namespace lan_watch::common
{
    using Timestamp = std::chrono::system_clock::time_point;

    class Clock
    {
    public:
        virtual ~Clock() = default;
        virtual Timestamp Now() const = 0;
    };

    class SystemClock : public Clock
    {
    public:
        Timestamp Now() const override { return std::chrono::system_clock::now(); }
    };

    inline double ToEpochSeconds(Timestamp ts)
    {
        return std::chrono::duration<double>(ts.time_since_epoch()).count();
    }
}
