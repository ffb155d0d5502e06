#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace lan_watch::common
{
    struct SshMetrics
    {
        std::optional<int> users_active;
        std::optional<double> cpu_percent;
        std::optional<double> mem_percent;
        std::optional<double> disk_percent;

        bool Empty() const { return !users_active && !cpu_percent && !mem_percent && !disk_percent; }
    };

    struct Gns3Status
    {
        bool active = false;
        bool api_ok = false;
        int projects_open = 0;
        std::optional<double> cpu_percent;
        std::optional<double> mem_percent;
        std::string url;
        std::optional<uint16_t> port;
    };

    // Out-of-range and non-finite percentages become absent; 0 and 100 are kept.
    inline std::optional<double> ValidPercent(std::optional<double> value)
    {
        if (!value || !std::isfinite(*value) || *value < 0.0 || *value > 100.0)
            return std::nullopt;
        return value;
    }

    inline SshMetrics Sanitized(SshMetrics metrics)
    {
        metrics.cpu_percent = ValidPercent(metrics.cpu_percent);
        metrics.mem_percent = ValidPercent(metrics.mem_percent);
        metrics.disk_percent = ValidPercent(metrics.disk_percent);
        if (metrics.users_active && *metrics.users_active < 0)
            metrics.users_active.reset();
        return metrics;
    }

    inline Gns3Status Sanitized(Gns3Status status)
    {
        status.cpu_percent = ValidPercent(status.cpu_percent);
        status.mem_percent = ValidPercent(status.mem_percent);
        if (status.projects_open < 0)
            status.projects_open = 0;
        return status;
    }
}
