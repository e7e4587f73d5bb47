#include "replaypack/cursor_buffer.hpp"
#include <algorithm>
#include <cstring>

namespace replaypack {

namespace {

void requireIPv4(std::span<const uint8_t> ip) {
    if (ip.size() != IPV4_SIZE) {
        throw CodecError(ErrorKind::InvalidIPv4,
                         ip.empty() ? std::string("no address")
                                    : std::to_string(ip.size()) + " byte address");
    }
}

bool allZero(std::span<const uint8_t> bytes) {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

}  // namespace

// ============================================================================
// Bool
// ============================================================================

bool CursorBuffer::readBool() {
    return readUInt8() != 0;
}

void CursorBuffer::writeBool(bool value) {
    writeUInt8(value ? 1 : 0);
}

void CursorBuffer::writeBoolAt(size_t offset, bool value) {
    writeUInt8At(offset, value ? 1 : 0);
}

// ============================================================================
// IPv4
// ============================================================================

std::vector<uint8_t> CursorBuffer::readIP() {
    return readBlob(IPV4_SIZE);
}

void CursorBuffer::writeIP(std::span<const uint8_t> ip) {
    requireIPv4(ip);
    writeBlob(ip);
}

void CursorBuffer::writeIPAt(size_t offset, std::span<const uint8_t> ip) {
    requireIPv4(ip);
    writeBlobAt(offset, ip);
}

// ============================================================================
// SockAddr
// ============================================================================

void CursorBuffer::encodeSockAddr(const SockAddr& addr, std::array<uint8_t, SOCK_ADDR_SIZE>& out) {
    out.fill(0);
    if (addr.empty()) {
        return;  // Family 0, port 0, no address
    }

    requireIPv4(addr.ip);

    out[0] = static_cast<uint8_t>(AddressFamily::INET & 0xFF);
    out[1] = static_cast<uint8_t>(AddressFamily::INET >> 8);
    out[2] = static_cast<uint8_t>(addr.port >> 8);
    out[3] = static_cast<uint8_t>(addr.port & 0xFF);
    std::memcpy(out.data() + 4, addr.ip.data(), IPV4_SIZE);
}

SockAddr CursorBuffer::readSockAddr() {
    requireReadable(SOCK_ADDR_SIZE);

    auto record = bytes().first(SOCK_ADDR_SIZE);
    readPos_ += SOCK_ADDR_SIZE;

    uint16_t family = static_cast<uint16_t>(record[0]) |
                      static_cast<uint16_t>(record[1] << 8);

    SockAddr addr;
    switch (family) {
        case AddressFamily::UNSPECIFIED:
            if (!allZero(record.subspan(2))) {
                throw CodecError(ErrorKind::InvalidSocketAddress, "family 0 with nonzero payload");
            }
            return addr;

        case AddressFamily::INET:
            if (!allZero(record.subspan(8))) {
                throw CodecError(ErrorKind::InvalidSocketAddress, "nonzero reserved bytes");
            }
            addr.port = static_cast<uint16_t>(record[2] << 8) | static_cast<uint16_t>(record[3]);
            addr.ip.assign(record.begin() + 4, record.begin() + 8);
            return addr;

        default:
            throw CodecError(ErrorKind::InvalidSocketAddress,
                             "unknown address family " + std::to_string(family));
    }
}

void CursorBuffer::writeSockAddr(const SockAddr& addr) {
    std::array<uint8_t, SOCK_ADDR_SIZE> record;
    encodeSockAddr(addr, record);
    writeBlob(record);
}

void CursorBuffer::writeSockAddrAt(size_t offset, const SockAddr& addr) {
    std::array<uint8_t, SOCK_ADDR_SIZE> record;
    encodeSockAddr(addr, record);
    writeBlobAt(offset, record);
}

// ============================================================================
// C string
// ============================================================================

std::string CursorBuffer::readCString() {
    auto unread = bytes();
    auto terminator = std::find(unread.begin(), unread.end(), uint8_t{0});

    if (terminator == unread.end()) {
        readPos_ = writePos_;
        throw CodecError(ErrorKind::NoTerminatorFound,
                         std::to_string(unread.size()) + " bytes discarded");
    }

    std::string result(unread.begin(), terminator);
    readPos_ += result.size() + 1;
    return result;
}

void CursorBuffer::writeCString(std::string_view str) {
    writeBlob(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(str.data()), str.size()));
    writeUInt8(0);
}

void CursorBuffer::writeCStringAt(size_t offset, std::string_view str) {
    requireWritten(offset, str.size() + 1);
    writeBlobAt(offset, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(str.data()), str.size()));
    writeUInt8At(offset + str.size(), 0);
}

// ============================================================================
// DWordString
// ============================================================================

DWordString CursorBuffer::readDString() {
    requireReadable(4);
    DWordString value;
    std::memcpy(value.data(), data_.data() + readPos_, 4);
    readPos_ += 4;
    return value;
}

void CursorBuffer::writeDString(const DWordString& value) {
    writeBlob(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()), value.size()));
}

void CursorBuffer::writeDStringAt(size_t offset, const DWordString& value) {
    writeBlobAt(offset, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()), value.size()));
}

}  // namespace replaypack
