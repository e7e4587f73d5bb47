#include "replaypack/block_format.hpp"
#include <array>
#include <zlib.h>

namespace replaypack {

uint16_t blockChecksum(std::span<const uint8_t> bytes) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, bytes.data(), static_cast<uInt>(bytes.size()));
    return foldChecksum(static_cast<uint32_t>(crc));
}

BlockHeader BlockHeader::parse(std::span<const uint8_t, BLOCK_HEADER_SIZE> bytes) {
    auto u16 = [&](size_t offset) {
        return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
    };

    BlockHeader header;
    header.compressedSize = u16(BlockField::COMPRESSED_SIZE);
    header.decompressedSize = u16(BlockField::DECOMPRESSED_SIZE);
    header.headerChecksum = u16(BlockField::HEADER_CHECKSUM);
    header.dataChecksum = u16(BlockField::DATA_CHECKSUM);
    return header;
}

uint16_t BlockHeader::expectedHeaderChecksum() const {
    std::array<uint8_t, BLOCK_HEADER_SIZE> raw{};
    raw[0] = static_cast<uint8_t>(compressedSize & 0xFF);
    raw[1] = static_cast<uint8_t>(compressedSize >> 8);
    raw[2] = static_cast<uint8_t>(decompressedSize & 0xFF);
    raw[3] = static_cast<uint8_t>(decompressedSize >> 8);
    return blockChecksum(raw);
}

}  // namespace replaypack
