#pragma once

/**
 * @file block_format.hpp
 * @brief Wire layout of one compressed block
 *
 * Every block is independently decompressible:
 *
 *   offset  width  field
 *   0       2      compressedSize    (LE, bytes following the header)
 *   2       2      decompressedSize  (LE, original chunk length)
 *   4       2      headerChecksum    (LE, fold(crc32(header with both checksums zero)))
 *   6       2      dataChecksum      (LE, fold(crc32(payload)))
 *   8       n      payload           (zlib stream, sync-flushed, no trailer)
 */

#include <cstddef>
#include <cstdint>
#include <span>

namespace replaypack {

constexpr size_t BLOCK_HEADER_SIZE = 8;
constexpr size_t MAX_BLOCK_SIZE = 0xFFFF;  // decompressedSize is a uint16

// Field offsets within the header
namespace BlockField {
    constexpr size_t COMPRESSED_SIZE = 0;
    constexpr size_t DECOMPRESSED_SIZE = 2;
    constexpr size_t HEADER_CHECKSUM = 4;
    constexpr size_t DATA_CHECKSUM = 6;
}

// Best compression, as the replay format expects
constexpr int DEFAULT_COMPRESSION_LEVEL = 9;

// Reduce a CRC32 to 16 bits (high half XOR low half)
[[nodiscard]] constexpr uint16_t foldChecksum(uint32_t crc) {
    return static_cast<uint16_t>((crc ^ (crc >> 16)) & 0xFFFF);
}

// fold(crc32(bytes)) using the IEEE polynomial
[[nodiscard]] uint16_t blockChecksum(std::span<const uint8_t> bytes);

struct BlockHeader {
    uint16_t compressedSize = 0;
    uint16_t decompressedSize = 0;
    uint16_t headerChecksum = 0;
    uint16_t dataChecksum = 0;

    bool operator==(const BlockHeader&) const = default;

    // Decode the first 8 bytes of a block
    [[nodiscard]] static BlockHeader parse(std::span<const uint8_t, BLOCK_HEADER_SIZE> bytes);

    // Checksum the header must carry: computed over the size fields with
    // both checksum fields zeroed
    [[nodiscard]] uint16_t expectedHeaderChecksum() const;
};

}  // namespace replaypack
