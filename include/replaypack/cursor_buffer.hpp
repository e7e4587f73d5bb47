#pragma once

/**
 * @file cursor_buffer.hpp
 * @brief Growable byte buffer with read/write cursors and typed field codec
 *
 * Integer fields are little-endian. Ports are the one exception and are
 * stored big-endian (network order), as the protocol carries them.
 */

#include "replaypack/byte_stream.hpp"
#include "replaypack/errors.hpp"
#include "replaypack/sock_addr.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace replaypack {

// Fixed 4-byte identifier (product codes, tags). No terminator, no length.
using DWordString = std::array<char, 4>;

// DWordString from a 4 character literal, e.g. dwordString("W3XP")
[[nodiscard]] constexpr DWordString dwordString(const char (&text)[5]) {
    return DWordString{text[0], text[1], text[2], text[3]};
}

// ============================================================================
// CursorBuffer
// ============================================================================
//
// Layout of the backing store:
//
//   0 ........ readPos ........ writePos ........ capacity
//   | consumed |     unread     |     writable     |
//
// - write*() append at writePos, growing the store as needed
// - read*() consume from readPos and throw CodecError(BufferUnderrun) when
//   fewer bytes than the field width remain; the cursor is left untouched
// - write*At(offset, ...) overwrite bytes in [0, writePos) in place and never
//   move either cursor; offset + width > writePos throws std::out_of_range
// - truncate() rewinds both cursors and keeps the capacity
//
// The buffer is both a ByteSink and a ByteSource, so a deflate stream can
// write straight into it and copyStream() can drain it into another sink.
//
class CursorBuffer : public ByteSink, public ByteSource {
public:
    CursorBuffer() = default;
    explicit CursorBuffer(std::span<const uint8_t> bytes);
    explicit CursorBuffer(std::vector<uint8_t> bytes);

    // ========================================================================
    // Streaming
    // ========================================================================

    // Append data; always succeeds
    IoResult write(std::span<const uint8_t> data) override;

    // Consume up to dst.size() unread bytes; {0, no error} when empty
    IoResult read(std::span<uint8_t> dst) override;

    // ========================================================================
    // Cursors and storage
    // ========================================================================

    // Unread byte count (writePos - readPos)
    [[nodiscard]] size_t size() const { return writePos_ - readPos_; }
    [[nodiscard]] bool empty() const { return writePos_ == readPos_; }

    [[nodiscard]] size_t readPos() const { return readPos_; }
    [[nodiscard]] size_t writePos() const { return writePos_; }
    [[nodiscard]] size_t capacity() const { return data_.size(); }

    // Unread bytes [readPos, writePos)
    [[nodiscard]] std::span<const uint8_t> bytes() const;
    [[nodiscard]] std::span<uint8_t> bytes();

    // All valid bytes [0, writePos), consumed ones included
    [[nodiscard]] std::span<const uint8_t> data() const;

    void truncate();
    void skip(size_t n);

    // Direct access to the writable region for byte-producing transforms:
    //   buf.ensureWritable(n);
    //   size_t produced = produce(buf.writablePtr(), buf.writableBytes());
    //   buf.advanceWrite(produced);
    void ensureWritable(size_t n);
    [[nodiscard]] uint8_t* writablePtr() { return data_.data() + writePos_; }
    [[nodiscard]] size_t writableBytes() const { return data_.size() - writePos_; }
    void advanceWrite(size_t n);

    // ========================================================================
    // Blobs
    // ========================================================================

    [[nodiscard]] std::vector<uint8_t> readBlob(size_t n);
    void writeBlob(std::span<const uint8_t> blob);
    void writeBlobAt(size_t offset, std::span<const uint8_t> blob);

    // ========================================================================
    // Integers (little-endian)
    // ========================================================================

    uint8_t readUInt8();
    uint16_t readUInt16();
    uint32_t readUInt32();

    void writeUInt8(uint8_t value);
    void writeUInt16(uint16_t value);
    void writeUInt32(uint32_t value);

    void writeUInt8At(size_t offset, uint8_t value);
    void writeUInt16At(size_t offset, uint16_t value);
    void writeUInt32At(size_t offset, uint32_t value);

    // Port (big-endian uint16)
    uint16_t readPort();
    void writePort(uint16_t port);
    void writePortAt(size_t offset, uint16_t port);

    // ========================================================================
    // Typed fields (field_codec.cpp)
    // ========================================================================

    // One byte, nonzero reads as true, writes 1 or 0
    bool readBool();
    void writeBool(bool value);
    void writeBoolAt(size_t offset, bool value);

    // Four raw octets. Writes throw CodecError(InvalidIPv4) unless ip has
    // exactly 4 bytes.
    [[nodiscard]] std::vector<uint8_t> readIP();
    void writeIP(std::span<const uint8_t> ip);
    void writeIPAt(size_t offset, std::span<const uint8_t> ip);

    // 16-byte sockaddr_in record (see sock_addr.hpp). An empty address is
    // written as 16 zero bytes. Reads consume the full record, then throw
    // CodecError(InvalidSocketAddress) if family and padding disagree.
    [[nodiscard]] SockAddr readSockAddr();
    void writeSockAddr(const SockAddr& addr);
    void writeSockAddrAt(size_t offset, const SockAddr& addr);

    // Zero-terminated string. Without a terminator the read consumes every
    // remaining byte and throws CodecError(NoTerminatorFound).
    [[nodiscard]] std::string readCString();
    void writeCString(std::string_view str);
    void writeCStringAt(size_t offset, std::string_view str);

    [[nodiscard]] DWordString readDString();
    void writeDString(const DWordString& value);
    void writeDStringAt(size_t offset, const DWordString& value);

private:
    static constexpr size_t INITIAL_CAPACITY = 256;

    // Throws CodecError(BufferUnderrun) if fewer than n bytes are unread
    void requireReadable(size_t n) const;

    // Throws std::out_of_range if [offset, offset + n) is not valid data
    void requireWritten(size_t offset, size_t n) const;

    // Encode a SockAddr record into out; validates the address first
    static void encodeSockAddr(const SockAddr& addr, std::array<uint8_t, SOCK_ADDR_SIZE>& out);

    std::vector<uint8_t> data_;
    size_t readPos_ = 0;
    size_t writePos_ = 0;
};

}  // namespace replaypack
