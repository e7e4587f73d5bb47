#include "replaypack/sock_addr.hpp"
#include <charconv>

namespace replaypack {

std::vector<uint8_t> ipv4(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
    return {a, b, c, d};
}

std::optional<std::vector<uint8_t>> parseIPv4(std::string_view text) {
    std::vector<uint8_t> out;
    out.reserve(IPV4_SIZE);

    const char* p = text.data();
    const char* end = text.data() + text.size();

    for (size_t i = 0; i < IPV4_SIZE; ++i) {
        if (i > 0) {
            if (p == end || *p != '.') {
                return std::nullopt;
            }
            ++p;
        }

        unsigned value = 0;
        auto [next, ec] = std::from_chars(p, end, value);
        if (ec != std::errc() || next == p || next - p > 3 || value > 255) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>(value));
        p = next;
    }

    if (p != end) {
        return std::nullopt;
    }
    return out;
}

std::string formatIPv4(const std::vector<uint8_t>& ip) {
    if (ip.size() != IPV4_SIZE) {
        return {};
    }
    return std::to_string(ip[0]) + "." + std::to_string(ip[1]) + "." +
           std::to_string(ip[2]) + "." + std::to_string(ip[3]);
}

std::string SockAddr::toString() const {
    if (empty()) {
        return "<empty>";
    }
    return formatIPv4(ip) + ":" + std::to_string(port);
}

}  // namespace replaypack
