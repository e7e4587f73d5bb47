#pragma once

/**
 * @file sock_addr.hpp
 * @brief IPv4 socket address as carried in game protocol packets
 *
 * Wire layout (16 bytes), mirroring struct sockaddr_in:
 *   family   (2, little-endian)  0 = unspecified, 2 = IPv4
 *   port     (2, big-endian)
 *   ipv4     (4, raw octets)
 *   reserved (8, zero)
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace replaypack {

namespace AddressFamily {
    constexpr uint16_t UNSPECIFIED = 0;
    constexpr uint16_t INET = 2;
}

constexpr size_t IPV4_SIZE = 4;
constexpr size_t SOCK_ADDR_SIZE = 16;

// Build a 4-byte address from its dotted components
[[nodiscard]] std::vector<uint8_t> ipv4(uint8_t a, uint8_t b, uint8_t c, uint8_t d);

// Parse "a.b.c.d". Returns nullopt on anything else.
[[nodiscard]] std::optional<std::vector<uint8_t>> parseIPv4(std::string_view text);

// Dotted form of a 4-byte address; empty string for any other length
[[nodiscard]] std::string formatIPv4(const std::vector<uint8_t>& ip);

struct SockAddr {
    uint16_t port = 0;
    std::vector<uint8_t> ip;  // Empty = no address

    [[nodiscard]] bool empty() const { return ip.empty(); }

    bool operator==(const SockAddr&) const = default;

    // "a.b.c.d:port", or "<empty>"
    [[nodiscard]] std::string toString() const;
};

}  // namespace replaypack
