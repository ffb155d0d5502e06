#include "Gns3StatusProbe.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace lan_watch::probes
{
    using common::FailureKind;
    using common::Gns3Status;
    using common::ProbeResult;
    using json = nlohmann::json;

    namespace
    {
        using SteadyClock = std::chrono::steady_clock;

        const uint16_t GNS3_PORTS[] = {3080, 3443, 80, 443};

        const std::vector<std::string> V3_STATS = {"/v3/system/statistics", "/v3/statistics", "/v3/compute/statistics"};
        const std::vector<std::string> V2_STATS = {"/v2/compute/statistics", "/v2/statistics", "/v2/compute/stats",
                                                   "/v2/system/statistics"};

        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::optional<double> FirstNumber(const json &doc, const std::vector<std::string> &keys)
        {
            for (const auto &key : keys)
            {
                auto it = doc.find(key);
                if (it != doc.end() && it->is_number())
                    return it->get<double>();
            }
            return std::nullopt;
        }

        bool IsAuthStatus(int status) { return status == 401 || status == 403; }

        std::chrono::milliseconds Remaining(SteadyClock::time_point deadline)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
        }

        // Tracks what the API calls of one probe ran into. Every call draws
        // on the same deadline.
        class ApiSession
        {
        public:
            ApiSession(common::HttpTransport &transport, std::string base, common::HttpHeaders headers,
                       SteadyClock::time_point deadline)
                : m_transport(transport), m_base(std::move(base)), m_headers(std::move(headers)), m_deadline(deadline),
                  m_answered(false), m_unauthorized(false)
            {
            }

            // Parsed body of a 2xx answer.
            std::optional<json> GetJson(const std::string &path)
            {
                const auto remaining = Remaining(m_deadline);
                if (remaining.count() <= 0)
                {
                    if (m_lastError.empty())
                        m_lastError = "timed out before " + path;
                    return std::nullopt;
                }

                auto result = m_transport.Get(m_base + path, m_headers, remaining);
                if (!result)
                {
                    if (result.Kind() == FailureKind::ProbeError)
                    {
                        m_answered = true;
                        m_lastError = result.Error().message;
                    }
                    return std::nullopt;
                }

                m_answered = true;
                const common::HttpResponse &response = result.Value();
                if (IsAuthStatus(response.status))
                    m_unauthorized = true;
                if (!response.Ok())
                {
                    m_lastError = "HTTP " + std::to_string(response.status) + " from " + path;
                    return std::nullopt;
                }

                json doc = json::parse(response.body, nullptr, false);
                if (doc.is_discarded())
                {
                    m_lastError = "invalid JSON from " + path;
                    return std::nullopt;
                }
                return doc;
            }

            ProbeResult<Gns3Status> Failure(const std::string &what) const
            {
                if (m_unauthorized)
                    return ProbeResult<Gns3Status>::Failure(FailureKind::ApiUnauthorized, what + ": token rejected");
                if (!m_answered)
                    return ProbeResult<Gns3Status>::Failure(FailureKind::ApiUnreachable, what + ": " + m_base + " unreachable");
                return ProbeResult<Gns3Status>::Failure(FailureKind::ApiError, what + ": " + m_lastError);
            }

            bool Unauthorized() const { return m_unauthorized; }
            void ClearUnauthorized() { m_unauthorized = false; }

        private:
            common::HttpTransport &m_transport;
            std::string m_base;
            common::HttpHeaders m_headers;
            SteadyClock::time_point m_deadline;
            bool m_answered;
            bool m_unauthorized;
            std::string m_lastError;
        };
    }

    int CountOpenProjects(const json &projects)
    {
        if (!projects.is_array())
            return 0;

        int open = 0;
        for (const auto &item : projects)
        {
            if (!item.is_object())
                continue;
            auto it = item.find("state");
            if (it == item.end())
                it = item.find("status");
            if (it == item.end() || !it->is_string())
                continue;
            std::string state = Lower(it->get<std::string>());
            if (state == "open" || state == "opened")
                ++open;
        }
        return open;
    }

    std::optional<double> ExtractCpuPercent(const json &stats)
    {
        if (!stats.is_object())
            return std::nullopt;
        return FirstNumber(stats, {"cpu_percent", "cpu_usage_percent", "system_cpu_percent", "cpu_usage"});
    }

    std::optional<double> ExtractMemPercent(const json &stats)
    {
        if (!stats.is_object())
            return std::nullopt;
        if (auto percent = FirstNumber(stats, {"memory_percent", "mem_percent", "system_memory_percent"}))
            return percent;

        auto used = FirstNumber(stats, {"memory_used", "mem_used", "system_memory_used"});
        auto total = FirstNumber(stats, {"memory_total", "mem_total", "system_memory_total"});
        if (!used || !total || *total == 0.0)
            return std::nullopt;
        return *used / *total * 100.0;
    }

    std::string AuthorizationValue(const common::Gns3Endpoint &endpoint)
    {
        if (Lower(endpoint.token_type) == "bearer")
            return "Bearer " + endpoint.token;
        return endpoint.token;
    }

    HttpGns3Probe::HttpGns3Probe(std::shared_ptr<common::HttpTransport> transport,
                                 PortChecker portChecker,
                                 std::chrono::milliseconds portTimeout)
        : m_transport(std::move(transport)), m_portChecker(std::move(portChecker)), m_portTimeout(portTimeout)
    {
    }

    ProbeResult<Gns3Status> HttpGns3Probe::Probe(const common::DeviceConfig &config,
                                                 std::chrono::milliseconds timeout)
    {
        const auto deadline = SteadyClock::now() + timeout;

        std::optional<ProbeResult<Gns3Status>> apiFailure;
        if (config.gns3 && config.gns3->HasToken() && m_transport)
        {
            auto api = QueryApi(*config.gns3, deadline);
            if (api)
                return api;
            apiFailure = api;
        }

        if (auto port = FindOpenPort(config.ip, deadline))
        {
            Gns3Status status;
            status.active = true;
            status.api_ok = false;
            status.port = *port;
            if (config.gns3 && !config.gns3->base_url.empty())
            {
                status.url = config.gns3->base_url;
            }
            else
            {
                const char *scheme = (*port == 443 || *port == 3443) ? "https" : "http";
                status.url = std::string(scheme) + "://" + config.ip + ":" + std::to_string(*port);
            }
            return ProbeResult<Gns3Status>::Success(status);
        }

        if (apiFailure)
            return *apiFailure;
        return ProbeResult<Gns3Status>::Failure(FailureKind::ApiUnreachable, "no GNS3 port open on " + config.ip);
    }

    ProbeResult<Gns3Status> HttpGns3Probe::QueryApi(const common::Gns3Endpoint &endpoint,
                                                    std::chrono::steady_clock::time_point deadline)
    {
        common::HttpHeaders headers = {{"Authorization", AuthorizationValue(endpoint)}};
        ApiSession api(*m_transport, endpoint.base_url, std::move(headers), deadline);

        std::string root;
        for (const char *candidate : {"/v3", "/v2"})
        {
            if (api.GetJson(std::string(candidate) + "/version"))
            {
                root = candidate;
                break;
            }
        }
        if (root.empty())
            return api.Failure("version");
        api.ClearUnauthorized();

        // Some servers ignore the filter, so projects are always filtered here.
        Gns3Status status;
        auto projects = api.GetJson(root + "/projects?state=opened");
        if (!projects)
            projects = api.GetJson(root + "/projects?status=opened");
        if (projects)
            status.projects_open = CountOpenProjects(*projects);
        if (status.projects_open == 0)
        {
            if (auto all = api.GetJson(root + "/projects"))
                status.projects_open = CountOpenProjects(*all);
        }
        if (api.Unauthorized())
            return api.Failure("projects");

        for (const auto &path : root == "/v3" ? V3_STATS : V2_STATS)
        {
            auto stats = api.GetJson(path);
            if (stats && stats->is_object())
            {
                status.cpu_percent = ExtractCpuPercent(*stats);
                status.mem_percent = ExtractMemPercent(*stats);
                break;
            }
        }

        status.active = true;
        status.api_ok = true;
        status.url = endpoint.base_url;
        if (auto url = common::ParseUrl(endpoint.base_url))
            status.port = url->port;
        return ProbeResult<Gns3Status>::Success(status);
    }

    std::optional<uint16_t> HttpGns3Probe::FindOpenPort(const std::string &ip,
                                                        std::chrono::steady_clock::time_point deadline) const
    {
        if (!m_portChecker)
            return std::nullopt;
        for (uint16_t port : GNS3_PORTS)
        {
            const auto remaining = Remaining(deadline);
            if (remaining.count() <= 0)
                break;
            if (m_portChecker(ip, port, std::min(m_portTimeout, remaining)))
                return port;
        }
        return std::nullopt;
    }
}
