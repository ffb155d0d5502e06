#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "../common/DeviceConfig.hpp"
#include "../common/HttpClient.hpp"
#include "../common/ProbeResult.hpp"
#include "../common/Telemetry.hpp"

namespace lan_watch::probes
{
    // Projects whose "state" (or "status") is open/opened; 0 for non-arrays.
    int CountOpenProjects(const nlohmann::json &projects);

    // Best-effort readings from a statistics document; nullopt when no known key matches.
    std::optional<double> ExtractCpuPercent(const nlohmann::json &stats);
    std::optional<double> ExtractMemPercent(const nlohmann::json &stats);

    // "Bearer <token>" for bearer tokens, the raw token otherwise.
    std::string AuthorizationValue(const common::Gns3Endpoint &endpoint);

    class Gns3StatusProbe
    {
    public:
        virtual ~Gns3StatusProbe() = default;

        // Failure kinds: ApiUnauthorized, ApiUnreachable, ApiError.
        virtual common::ProbeResult<common::Gns3Status> Probe(const common::DeviceConfig &config,
                                                              std::chrono::milliseconds timeout) = 0;
    };

    // Queries the GNS3 REST API when a token is configured and falls back to
    // checking the well-known GNS3 ports. The timeout bounds the whole probe.
    class HttpGns3Probe : public Gns3StatusProbe
    {
    public:
        using PortChecker = std::function<bool(const std::string &, uint16_t, std::chrono::milliseconds)>;

        HttpGns3Probe(std::shared_ptr<common::HttpTransport> transport,
                      PortChecker portChecker,
                      std::chrono::milliseconds portTimeout = std::chrono::milliseconds(400));

        common::ProbeResult<common::Gns3Status> Probe(const common::DeviceConfig &config,
                                                      std::chrono::milliseconds timeout) override;

    private:
        common::ProbeResult<common::Gns3Status> QueryApi(const common::Gns3Endpoint &endpoint,
                                                         std::chrono::steady_clock::time_point deadline);
        std::optional<uint16_t> FindOpenPort(const std::string &ip, std::chrono::steady_clock::time_point deadline) const;

        std::shared_ptr<common::HttpTransport> m_transport;
        PortChecker m_portChecker;
        std::chrono::milliseconds m_portTimeout;
    };
}
