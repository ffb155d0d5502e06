#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include "ProbeResult.hpp"

namespace lan_watch::common
{
    // Blocking-style helpers built on non-blocking sockets and poll(2).

    // Returns a connected socket in non-blocking mode; the caller owns the fd.
    // Failure kinds: Unreachable (refused, no route, bad address), Timeout.
    ProbeResult<int> ConnectTcp(const std::string &host, uint16_t port, std::chrono::milliseconds timeout);

    bool TcpPortOpen(const std::string &host, uint16_t port, std::chrono::milliseconds timeout);

    // Waits for events on fd until the deadline; false on timeout or error.
    bool WaitFd(int fd, short events, std::chrono::steady_clock::time_point deadline);
}
