#pragma once

/**
 * @file block_decompressor.hpp
 * @brief Reads the block container written by BlockCompressor
 */

#include "replaypack/block_format.hpp"
#include "replaypack/byte_stream.hpp"
#include "replaypack/cursor_buffer.hpp"
#include <cstdint>
#include <span>
#include <vector>
#include <zlib.h>

namespace replaypack {

// BlockDecompressor - ByteSource over a block container
//
// Each block is checked before it is inflated:
//   - a stream ending inside a header or payload -> TruncatedBlock
//   - header or data checksum mismatch           -> ChecksumMismatch
//   - inflate error or wrong decompressed size    -> CompressionFailure
// End of stream exactly at a block boundary is a clean end.
//
// Padding written by BufferedBlockWriter::close() comes back as ordinary
// zero bytes; the replay header's size field says where real data ends.
//
class BlockDecompressor : public ByteSource {
public:
    explicit BlockDecompressor(ByteSource& source);
    ~BlockDecompressor() override;

    BlockDecompressor(const BlockDecompressor&) = delete;
    BlockDecompressor& operator=(const BlockDecompressor&) = delete;
    BlockDecompressor(BlockDecompressor&&) = delete;
    BlockDecompressor& operator=(BlockDecompressor&&) = delete;

    // Decode the next block and append it to out. Returns the decompressed
    // size; {0, no error} once the source is exhausted.
    IoResult readBlock(CursorBuffer& out);

    // Stream view over all blocks
    IoResult read(std::span<uint8_t> dst) override;

    [[nodiscard]] bool atEnd() const { return eof_ && pending_.empty(); }

    // Compressed bytes consumed from the source (headers included)
    [[nodiscard]] uint32_t sizeRead() const { return sizeRead_; }

    // Decompressed bytes produced
    [[nodiscard]] uint32_t sizeTotal() const { return sizeTotal_; }

    [[nodiscard]] uint32_t blockCount() const { return blockCount_; }

private:
    // Read until dst is full, the source ends, or it fails
    IoResult readFull(std::span<uint8_t> dst);

    ByteSource& source_;
    z_stream zs_{};
    std::vector<uint8_t> payload_;
    CursorBuffer pending_;  // Decoded bytes not yet returned by read()
    bool eof_ = false;

    uint32_t sizeRead_ = 0;
    uint32_t sizeTotal_ = 0;
    uint32_t blockCount_ = 0;
};

}  // namespace replaypack
