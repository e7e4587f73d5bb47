#pragma once

/**
 * @file block_compressor.hpp
 * @brief Splits a byte stream into independently compressed, checksummed blocks
 */

#include "replaypack/block_format.hpp"
#include "replaypack/byte_stream.hpp"
#include "replaypack/cursor_buffer.hpp"
#include <cstdint>
#include <span>
#include <zlib.h>

namespace replaypack {

// BlockCompressor - ByteSink that emits the block container format
//
// Every write() is cut into chunks of at most MAX_BLOCK_SIZE bytes. Each
// chunk becomes one block (see block_format.hpp) written to the sink with a
// single sink.write() call. A chunk whose payload would exceed MAX_BLOCK_SIZE
// is halved until it fits, so any input can be written. The deflate stream is reset per block, so no
// block depends on another.
//
// On failure write() returns the number of input bytes deflate absorbed so
// far together with the error. Blocks already handed to the sink stay
// written; the stream must not be continued after a failure.
//
class BlockCompressor : public ByteSink {
public:
    // Compression level from ConfigManager if initialized, else
    // DEFAULT_COMPRESSION_LEVEL
    explicit BlockCompressor(ByteSink& sink);
    BlockCompressor(ByteSink& sink, int level);
    ~BlockCompressor() override;

    // Non-copyable, non-movable (zlib state points back at the z_stream)
    BlockCompressor(const BlockCompressor&) = delete;
    BlockCompressor& operator=(const BlockCompressor&) = delete;
    BlockCompressor(BlockCompressor&&) = delete;
    BlockCompressor& operator=(BlockCompressor&&) = delete;

    IoResult write(std::span<const uint8_t> data) override;

    [[nodiscard]] int level() const { return level_; }

    // Compressed bytes handed to the sink
    [[nodiscard]] uint32_t sizeWritten() const { return sizeWritten_; }

    // Uncompressed bytes accepted
    [[nodiscard]] uint32_t sizeTotal() const { return sizeTotal_; }

    [[nodiscard]] uint32_t blockCount() const { return blockCount_; }

    // Remove synthetic padding from sizeTotal (see BufferedBlockWriter::close)
    void excludePadding(uint32_t n) { sizeTotal_ -= n; }

private:
    // Compress one chunk into block_ and send it. absorbed receives the
    // number of chunk bytes deflate consumed. oversized is set, with nothing
    // sent, when the payload would not fit the 16-bit size field.
    IoResult writeBlock(std::span<const uint8_t> chunk, size_t& absorbed, bool& oversized);

    // deflate() into the write cursor of block_ until flush completes
    bool deflateInto(int flush);

    ByteSink& sink_;
    int level_;
    z_stream zs_{};

    // Scratch block (header + payload). Rebuilt from scratch for every block
    // and only meaningful inside writeBlock(); never handed out.
    CursorBuffer block_;

    uint32_t sizeWritten_ = 0;
    uint32_t sizeTotal_ = 0;
    uint32_t blockCount_ = 0;
};

}  // namespace replaypack
