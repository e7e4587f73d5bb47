#include "replaypack/cursor_buffer.hpp"
#include <algorithm>
#include <cstring>
#include <functional>
#include <stdexcept>

namespace replaypack {

CursorBuffer::CursorBuffer(std::span<const uint8_t> bytes)
    : data_(bytes.begin(), bytes.end())
    , writePos_(bytes.size())
{
}

CursorBuffer::CursorBuffer(std::vector<uint8_t> bytes)
    : data_(std::move(bytes))
{
    writePos_ = data_.size();
}

// ============================================================================
// Streaming
// ============================================================================

IoResult CursorBuffer::write(std::span<const uint8_t> data) {
    writeBlob(data);
    return IoResult::success(data.size());
}

IoResult CursorBuffer::read(std::span<uint8_t> dst) {
    size_t n = std::min(dst.size(), size());
    if (n > 0) {
        std::memcpy(dst.data(), data_.data() + readPos_, n);
        readPos_ += n;
    }
    return IoResult::success(n);
}

// ============================================================================
// Cursors and storage
// ============================================================================

std::span<const uint8_t> CursorBuffer::bytes() const {
    return std::span<const uint8_t>(data_.data() + readPos_, size());
}

std::span<uint8_t> CursorBuffer::bytes() {
    return std::span<uint8_t>(data_.data() + readPos_, size());
}

std::span<const uint8_t> CursorBuffer::data() const {
    return std::span<const uint8_t>(data_.data(), writePos_);
}

void CursorBuffer::truncate() {
    readPos_ = 0;
    writePos_ = 0;
}

void CursorBuffer::skip(size_t n) {
    requireReadable(n);
    readPos_ += n;
}

void CursorBuffer::ensureWritable(size_t n) {
    if (writableBytes() >= n) {
        return;
    }

    size_t needed = writePos_ + n;
    size_t newCap = std::max(data_.size(), INITIAL_CAPACITY);
    while (newCap < needed) {
        newCap *= 2;
    }
    data_.resize(newCap);
}

void CursorBuffer::advanceWrite(size_t n) {
    if (n > writableBytes()) {
        throw std::out_of_range("CursorBuffer::advanceWrite past capacity");
    }
    writePos_ += n;
}

void CursorBuffer::requireReadable(size_t n) const {
    if (size() < n) {
        throw CodecError(ErrorKind::BufferUnderrun,
                         "need " + std::to_string(n) + " bytes, " +
                         std::to_string(size()) + " unread");
    }
}

void CursorBuffer::requireWritten(size_t offset, size_t n) const {
    if (offset > writePos_ || n > writePos_ - offset) {
        throw std::out_of_range("CursorBuffer: write at offset " + std::to_string(offset) +
                                " width " + std::to_string(n) +
                                " beyond written length " + std::to_string(writePos_));
    }
}

// ============================================================================
// Blobs
// ============================================================================

std::vector<uint8_t> CursorBuffer::readBlob(size_t n) {
    if (n == 0) {
        return {};
    }
    requireReadable(n);

    std::vector<uint8_t> out(data_.begin() + static_cast<std::ptrdiff_t>(readPos_),
                             data_.begin() + static_cast<std::ptrdiff_t>(readPos_ + n));
    readPos_ += n;
    return out;
}

void CursorBuffer::writeBlob(std::span<const uint8_t> blob) {
    if (blob.empty()) {
        return;
    }
    // blob may view our own storage, which growth would move
    const uint8_t* base = data_.data();
    std::less<const uint8_t*> before;
    if (!before(blob.data(), base) && before(blob.data(), base + data_.size())) {
        size_t offset = static_cast<size_t>(blob.data() - base);
        ensureWritable(blob.size());
        std::memmove(writablePtr(), data_.data() + offset, blob.size());
    } else {
        ensureWritable(blob.size());
        std::memcpy(writablePtr(), blob.data(), blob.size());
    }
    writePos_ += blob.size();
}

void CursorBuffer::writeBlobAt(size_t offset, std::span<const uint8_t> blob) {
    requireWritten(offset, blob.size());
    if (!blob.empty()) {
        std::memmove(data_.data() + offset, blob.data(), blob.size());
    }
}

// ============================================================================
// Integers
// ============================================================================

uint8_t CursorBuffer::readUInt8() {
    requireReadable(1);
    return data_[readPos_++];
}

uint16_t CursorBuffer::readUInt16() {
    requireReadable(2);
    uint16_t value = static_cast<uint16_t>(data_[readPos_]) |
                     static_cast<uint16_t>(data_[readPos_ + 1] << 8);
    readPos_ += 2;
    return value;
}

uint32_t CursorBuffer::readUInt32() {
    requireReadable(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data_[readPos_ + i]) << (i * 8);
    }
    readPos_ += 4;
    return value;
}

void CursorBuffer::writeUInt8(uint8_t value) {
    ensureWritable(1);
    data_[writePos_++] = value;
}

void CursorBuffer::writeUInt16(uint16_t value) {
    ensureWritable(2);
    writePos_ += 2;
    writeUInt16At(writePos_ - 2, value);
}

void CursorBuffer::writeUInt32(uint32_t value) {
    ensureWritable(4);
    writePos_ += 4;
    writeUInt32At(writePos_ - 4, value);
}

void CursorBuffer::writeUInt8At(size_t offset, uint8_t value) {
    requireWritten(offset, 1);
    data_[offset] = value;
}

void CursorBuffer::writeUInt16At(size_t offset, uint16_t value) {
    requireWritten(offset, 2);
    data_[offset] = static_cast<uint8_t>(value & 0xFF);
    data_[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void CursorBuffer::writeUInt32At(size_t offset, uint32_t value) {
    requireWritten(offset, 4);
    for (int i = 0; i < 4; ++i) {
        data_[offset + i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
}

uint16_t CursorBuffer::readPort() {
    requireReadable(2);
    uint16_t port = static_cast<uint16_t>(data_[readPos_] << 8) |
                    static_cast<uint16_t>(data_[readPos_ + 1]);
    readPos_ += 2;
    return port;
}

void CursorBuffer::writePort(uint16_t port) {
    ensureWritable(2);
    writePos_ += 2;
    writePortAt(writePos_ - 2, port);
}

void CursorBuffer::writePortAt(size_t offset, uint16_t port) {
    requireWritten(offset, 2);
    data_[offset] = static_cast<uint8_t>((port >> 8) & 0xFF);
    data_[offset + 1] = static_cast<uint8_t>(port & 0xFF);
}

}  // namespace replaypack
