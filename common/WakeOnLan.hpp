#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lan_watch::common
{
    inline constexpr uint16_t WOL_DEFAULT_PORT = 9;
    inline constexpr size_t MAGIC_PACKET_SIZE = 102;

    // "aa:bb:cc:dd:ee:ff" or "AA-BB-CC-DD-EE-FF"; throws std::invalid_argument otherwise.
    std::vector<uint8_t> ParseMac(const std::string &mac);

    // 6 x 0xFF followed by the MAC repeated 16 times.
    std::vector<uint8_t> BuildMagicPacket(const std::string &mac);

    // Empty broadcast means 255.255.255.255. Throws std::runtime_error on socket errors.
    void SendMagicPacket(const std::string &mac, const std::string &broadcast = "", uint16_t port = WOL_DEFAULT_PORT);
}
