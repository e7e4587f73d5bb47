#pragma once

/**
 * @file buffered_block_writer.hpp
 * @brief Buffered, record-aware front end of BlockCompressor
 */

#include "replaypack/block_compressor.hpp"
#include "replaypack/byte_stream.hpp"
#include "replaypack/record.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace replaypack {

constexpr size_t DEFAULT_WRITER_BUFFER_SIZE = 8192;

// BufferedBlockWriter - writes replay data as fixed-size compressed blocks
//
// Bytes and records accumulate in a buffer of capacity() bytes. Every time
// the buffer fills it is compressed as one block. close() zero-pads the last
// partial block up to capacity() so all blocks decompress to the same size,
// and removes the padding from sizeTotal(). A buffer near MAX_BLOCK_SIZE that
// does not compress may be split by BlockCompressor into two blocks.
//
// Errors are sticky: after a failed flush every later call returns the same
// error without touching the stream.
//
// Usage:
//   OStreamSink sink(file);
//   BufferedBlockWriter writer(sink);
//   writer.writeRecord(chat);
//   writer.write(rawBytes);
//   if (!writer.close()) { ... }
//   header.decompressedSize = writer.sizeTotal();
//
class BufferedBlockWriter : public ByteSink {
public:
    // Capacity from ConfigManager if initialized, else DEFAULT_WRITER_BUFFER_SIZE
    explicit BufferedBlockWriter(ByteSink& sink);

    // encoder defaults to PacketRecordEncoder. Throws std::invalid_argument
    // for a zero capacity.
    BufferedBlockWriter(ByteSink& sink, size_t capacity,
                        std::unique_ptr<RecordEncoder> encoder = nullptr);

    BufferedBlockWriter(const BufferedBlockWriter&) = delete;
    BufferedBlockWriter& operator=(const BufferedBlockWriter&) = delete;

    IoResult write(std::span<const uint8_t> data) override;

    // Serialize records through the encoder into this writer
    IoResult writeRecord(const Record& record);
    IoResult writeRecords(std::span<const Record* const> records);

    // Compress whatever is buffered, even if short of capacity
    IoResult flush();

    // Pad the final block and flush. Call once, after the last write.
    IoResult close();

    [[nodiscard]] size_t capacity() const { return buffer_.size(); }
    [[nodiscard]] size_t buffered() const { return buffered_; }
    [[nodiscard]] size_t available() const { return buffer_.size() - buffered_; }

    [[nodiscard]] uint32_t sizeWritten() const { return compressor_.sizeWritten(); }
    [[nodiscard]] uint32_t sizeTotal() const { return compressor_.sizeTotal(); }
    [[nodiscard]] uint32_t blockCount() const { return compressor_.blockCount(); }

    [[nodiscard]] const BlockCompressor& compressor() const { return compressor_; }

private:
    BlockCompressor compressor_;
    std::vector<uint8_t> buffer_;
    size_t buffered_ = 0;
    std::unique_ptr<RecordEncoder> encoder_;
    std::optional<ErrorKind> error_;
};

}  // namespace replaypack
