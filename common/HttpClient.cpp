#include "HttpClient.hpp"
#include <algorithm>
#include <cctype>
#include <httplib.h>

namespace lan_watch::common
{
    namespace
    {
        std::string ToLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::pair<time_t, long> ToTimeoutPair(std::chrono::milliseconds ms)
        {
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(ms);
            auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ms - seconds);
            return {static_cast<time_t>(seconds.count()), static_cast<long>(micros.count())};
        }

        FailureKind KindOf(httplib::Error error)
        {
            switch (error)
            {
            case httplib::Error::Connection:
                return FailureKind::Unreachable;
            case httplib::Error::Read:
            case httplib::Error::Write:
                return FailureKind::Timeout;
            default:
                return FailureKind::ProbeError;
            }
        }
    }

    std::optional<Url> ParseUrl(const std::string &url)
    {
        size_t schemeEnd = url.find("://");
        if (schemeEnd == std::string::npos)
            return std::nullopt;

        Url parsed;
        parsed.scheme = ToLower(url.substr(0, schemeEnd));
        if (parsed.scheme != "http" && parsed.scheme != "https")
            return std::nullopt;

        size_t hostStart = schemeEnd + 3;
        size_t pathStart = url.find('/', hostStart);
        std::string authority = url.substr(hostStart, pathStart == std::string::npos ? std::string::npos : pathStart - hostStart);
        parsed.path = pathStart == std::string::npos ? "/" : url.substr(pathStart);

        size_t colon = authority.rfind(':');
        if (colon != std::string::npos)
        {
            parsed.host = authority.substr(0, colon);
            try
            {
                int port = std::stoi(authority.substr(colon + 1));
                if (port <= 0 || port > 65535)
                    return std::nullopt;
                parsed.port = static_cast<uint16_t>(port);
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }
        else
        {
            parsed.host = authority;
            parsed.port = parsed.IsTls() ? 443 : 80;
        }

        if (parsed.host.empty())
            return std::nullopt;
        return parsed;
    }

    ProbeResult<HttpResponse> HttpClient::Get(const std::string &url, const HttpHeaders &headers,
                                              std::chrono::milliseconds timeout)
    {
        auto target = ParseUrl(url);
        if (!target)
            return ProbeResult<HttpResponse>::Failure(FailureKind::ProbeError, "invalid URL '" + url + "'");

        // The scheme://host:port form picks the TLS implementation for https.
        httplib::Client client(target->Origin());
        if (target->IsTls())
            client.enable_server_certificate_verification(false);

        auto [sec, usec] = ToTimeoutPair(timeout);
        client.set_connection_timeout(sec, usec);
        client.set_read_timeout(sec, usec);
        client.set_write_timeout(sec, usec);

        httplib::Headers requestHeaders = {{"Accept", "application/json"}};
        for (const auto &header : headers)
            requestHeaders.emplace(header.first, header.second);

        auto response = client.Get(target->path.c_str(), requestHeaders);
        if (!response)
        {
            const httplib::Error error = response.error();
            return ProbeResult<HttpResponse>::Failure(KindOf(error), target->Origin() + ": " + httplib::to_string(error));
        }

        HttpResponse out;
        out.status = response->status;
        out.body = response->body;
        return ProbeResult<HttpResponse>::Success(std::move(out));
    }
}
