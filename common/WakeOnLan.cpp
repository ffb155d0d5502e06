#include "WakeOnLan.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace lan_watch::common
{
    std::vector<uint8_t> ParseMac(const std::string &mac)
    {
        if (mac.size() != 17)
            throw std::invalid_argument("Invalid MAC address format: '" + mac + "'");

        std::vector<uint8_t> bytes;
        bytes.reserve(6);
        for (size_t i = 0; i < 6; ++i)
        {
            size_t off = i * 3;
            if (i > 0 && mac[off - 1] != ':' && mac[off - 1] != '-')
                throw std::invalid_argument("Invalid MAC address format: '" + mac + "'");

            unsigned value = 0;
            for (size_t j = 0; j < 2; ++j)
            {
                char c = mac[off + j];
                value <<= 4;
                if (c >= '0' && c <= '9')
                    value |= static_cast<unsigned>(c - '0');
                else if (c >= 'a' && c <= 'f')
                    value |= static_cast<unsigned>(c - 'a' + 10);
                else if (c >= 'A' && c <= 'F')
                    value |= static_cast<unsigned>(c - 'A' + 10);
                else
                    throw std::invalid_argument("Invalid MAC address format: '" + mac + "'");
            }
            bytes.push_back(static_cast<uint8_t>(value));
        }
        return bytes;
    }

    std::vector<uint8_t> BuildMagicPacket(const std::string &mac)
    {
        std::vector<uint8_t> macBytes = ParseMac(mac);

        std::vector<uint8_t> packet(6, 0xFF);
        packet.reserve(MAGIC_PACKET_SIZE);
        for (int i = 0; i < 16; ++i)
            packet.insert(packet.end(), macBytes.begin(), macBytes.end());
        return packet;
    }

    void SendMagicPacket(const std::string &mac, const std::string &broadcast, uint16_t port)
    {
        std::vector<uint8_t> payload = BuildMagicPacket(mac);
        const std::string target = broadcast.empty() ? "255.255.255.255" : broadcast;

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, target.c_str(), &addr.sin_addr) != 1)
            throw std::runtime_error("Invalid broadcast address: " + target);

        int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
        if (fd < 0)
            throw std::runtime_error(std::string("Socket creation failed: ") + std::strerror(errno));

        int enable = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0)
        {
            int err = errno;
            close(fd);
            throw std::runtime_error(std::string("SO_BROADCAST failed: ") + std::strerror(err));
        }

        ssize_t sent = sendto(fd, payload.data(), payload.size(), 0, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        int err = errno;
        close(fd);
        if (sent != static_cast<ssize_t>(payload.size()))
            throw std::runtime_error(std::string("sendto failed: ") + std::strerror(err));
    }
}
