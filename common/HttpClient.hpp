#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "ProbeResult.hpp"

namespace lan_watch::common
{
    struct Url
    {
        std::string scheme;
        std::string host;
        uint16_t port = 0;
        std::string path;

        bool IsTls() const { return scheme == "https"; }
        std::string Origin() const { return scheme + "://" + host + ":" + std::to_string(port); }
    };

    // Accepts http:// and https:// with optional port and path.
    std::optional<Url> ParseUrl(const std::string &url);

    struct HttpResponse
    {
        int status = 0;
        std::string body;

        bool Ok() const { return status >= 200 && status < 300; }
    };

    using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        // Failure kinds: Unreachable, Timeout, ProbeError (bad URL or response).
        virtual ProbeResult<HttpResponse> Get(const std::string &url, const HttpHeaders &headers,
                                              std::chrono::milliseconds timeout) = 0;
    };

    // cpp-httplib client; https skips certificate verification since GNS3
    // servers commonly run with self-signed certificates.
    class HttpClient : public HttpTransport
    {
    public:
        ProbeResult<HttpResponse> Get(const std::string &url, const HttpHeaders &headers,
                                      std::chrono::milliseconds timeout) override;
    };
}
