#include "SocketUtil.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lan_watch::common
{
    bool WaitFd(int fd, short events, std::chrono::steady_clock::time_point deadline)
    {
        while (true)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0)
                return false;

            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = events;
            int r = poll(&pfd, 1, static_cast<int>(left));
            if (r < 0 && errno == EINTR)
                continue;
            return r > 0;
        }
    }

    ProbeResult<int> ConnectTcp(const std::string &host, uint16_t port, std::chrono::milliseconds timeout)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
        {
            addrinfo hints{};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_STREAM;
            addrinfo *res = nullptr;
            if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res)
                return ProbeResult<int>::Failure(FailureKind::Unreachable, "cannot resolve " + host);
            addr.sin_addr = reinterpret_cast<sockaddr_in *>(res->ai_addr)->sin_addr;
            freeaddrinfo(res);
        }

        int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0)
            return ProbeResult<int>::Failure(FailureKind::ProbeError, std::string("socket: ") + std::strerror(errno));

        if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0)
            return ProbeResult<int>::Success(fd);

        if (errno != EINPROGRESS)
        {
            int err = errno;
            close(fd);
            return ProbeResult<int>::Failure(FailureKind::Unreachable, std::string("connect: ") + std::strerror(err));
        }

        if (!WaitFd(fd, POLLOUT, deadline))
        {
            close(fd);
            return ProbeResult<int>::Failure(FailureKind::Timeout, "connect to " + host + ":" + std::to_string(port) + " timed out");
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0)
        {
            close(fd);
            return ProbeResult<int>::Failure(FailureKind::Unreachable, std::string("connect: ") + std::strerror(soError));
        }

        return ProbeResult<int>::Success(fd);
    }

    bool TcpPortOpen(const std::string &host, uint16_t port, std::chrono::milliseconds timeout)
    {
        auto result = ConnectTcp(host, port, timeout);
        if (!result)
            return false;
        close(result.Value());
        return true;
    }
}
