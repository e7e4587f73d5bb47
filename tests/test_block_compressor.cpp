#include <gtest/gtest.h>
#include "replaypack/block_compressor.hpp"
#include "replaypack/block_format.hpp"
#include "replaypack/cursor_buffer.hpp"
#include <random>
#include <vector>
#include <zlib.h>

using namespace replaypack;

namespace {

struct ParsedBlock {
    BlockHeader header;
    std::vector<uint8_t> raw;      // Header + payload as written
    std::vector<uint8_t> payload;
};

// Split a container into blocks using only the size field
std::vector<ParsedBlock> splitBlocks(std::span<const uint8_t> bytes) {
    std::vector<ParsedBlock> blocks;
    size_t pos = 0;
    while (pos < bytes.size()) {
        EXPECT_GE(bytes.size() - pos, BLOCK_HEADER_SIZE);
        if (bytes.size() - pos < BLOCK_HEADER_SIZE) break;

        ParsedBlock block;
        block.header = BlockHeader::parse(bytes.subspan(pos).first<BLOCK_HEADER_SIZE>());
        size_t end = pos + BLOCK_HEADER_SIZE + block.header.compressedSize;
        EXPECT_LE(end, bytes.size());
        if (end > bytes.size()) break;

        block.raw.assign(bytes.begin() + pos, bytes.begin() + end);
        block.payload.assign(bytes.begin() + pos + BLOCK_HEADER_SIZE, bytes.begin() + end);
        blocks.push_back(std::move(block));
        pos = end;
    }
    return blocks;
}

uint16_t foldedCrc(const uint8_t* data, size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, data, static_cast<uInt>(size));
    return static_cast<uint16_t>((crc >> 16) ^ (crc & 0xFFFF));
}

// Inflate one payload with a fresh stream
std::vector<uint8_t> inflatePayload(const std::vector<uint8_t>& payload, size_t expected) {
    z_stream zs{};
    EXPECT_EQ(inflateInit(&zs), Z_OK);

    std::vector<uint8_t> out(expected + 16);
    zs.next_in = const_cast<Bytef*>(payload.data());
    zs.avail_in = static_cast<uInt>(payload.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    int rc = inflate(&zs, Z_SYNC_FLUSH);
    EXPECT_TRUE(rc == Z_OK || rc == Z_BUF_ERROR) << "inflate returned " << rc;
    out.resize(out.size() - zs.avail_out);
    inflateEnd(&zs);
    return out;
}

std::vector<uint8_t> patternBytes(size_t n) {
    std::vector<uint8_t> data(n);
    for (size_t i = 0; i < n; ++i) {
        data[i] = static_cast<uint8_t>((i * 7) % 61);
    }
    return data;
}

std::vector<uint8_t> randomBytes(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<uint8_t> data(n);
    for (auto& b : data) {
        b = static_cast<uint8_t>(dist(rng));
    }
    return data;
}

// Accepts up to `limit` bytes in total, then fails every write
class LimitedSink : public ByteSink {
public:
    explicit LimitedSink(size_t limit) : limit_(limit) {}

    IoResult write(std::span<const uint8_t> data) override {
        size_t room = limit_ - received.size();
        if (data.size() <= room) {
            received.insert(received.end(), data.begin(), data.end());
            return IoResult::success(data.size());
        }
        received.insert(received.end(), data.begin(), data.begin() + room);
        return IoResult::failure(room, ErrorKind::SinkIOFailure);
    }

    std::vector<uint8_t> received;

private:
    size_t limit_;
};

}  // namespace

// ============================================================================
// Block layout
// ============================================================================

TEST(BlockCompressorTest, SingleChunkHeader) {
    CursorBuffer out;
    BlockCompressor compressor(out, DEFAULT_COMPRESSION_LEVEL);

    auto data = patternBytes(1000);
    IoResult r = compressor.write(data);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.count, 1000u);

    auto blocks = splitBlocks(out.bytes());
    ASSERT_EQ(blocks.size(), 1u);
    const auto& block = blocks[0];

    EXPECT_EQ(block.header.decompressedSize, 1000);
    EXPECT_EQ(block.header.compressedSize, out.size() - BLOCK_HEADER_SIZE);

    // Header checksum covers the 8 header bytes with both checksum fields zero
    std::vector<uint8_t> zeroed(block.raw.begin(), block.raw.begin() + BLOCK_HEADER_SIZE);
    zeroed[4] = zeroed[5] = zeroed[6] = zeroed[7] = 0;
    EXPECT_EQ(block.header.headerChecksum, foldedCrc(zeroed.data(), zeroed.size()));
    EXPECT_EQ(block.header.dataChecksum, foldedCrc(block.payload.data(), block.payload.size()));

    EXPECT_EQ(block.header.headerChecksum, block.header.expectedHeaderChecksum());
    EXPECT_EQ(block.header.dataChecksum, blockChecksum(block.payload));
}

TEST(BlockCompressorTest, PayloadInflatesToInput) {
    CursorBuffer out;
    BlockCompressor compressor(out, DEFAULT_COMPRESSION_LEVEL);

    auto data = patternBytes(5000);
    ASSERT_TRUE(compressor.write(data).ok());

    auto blocks = splitBlocks(out.bytes());
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_LT(blocks[0].payload.size(), data.size());
    EXPECT_EQ(inflatePayload(blocks[0].payload, data.size()), data);
}

TEST(BlockCompressorTest, LargeWriteSplitsIntoBlocks) {
    CursorBuffer out;
    BlockCompressor compressor(out, DEFAULT_COMPRESSION_LEVEL);

    auto data = patternBytes(2 * MAX_BLOCK_SIZE + 100);
    IoResult r = compressor.write(data);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.count, data.size());

    auto blocks = splitBlocks(out.bytes());
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].header.decompressedSize, MAX_BLOCK_SIZE);
    EXPECT_EQ(blocks[1].header.decompressedSize, MAX_BLOCK_SIZE);
    EXPECT_EQ(blocks[2].header.decompressedSize, 100);

    // Every block decodes on its own
    size_t offset = 0;
    for (const auto& block : blocks) {
        size_t n = block.header.decompressedSize;
        std::vector<uint8_t> expected(data.begin() + offset, data.begin() + offset + n);
        EXPECT_EQ(inflatePayload(block.payload, n), expected);
        offset += n;
    }

    EXPECT_EQ(compressor.blockCount(), 3u);
    EXPECT_EQ(compressor.sizeTotal(), data.size());
    EXPECT_EQ(compressor.sizeWritten(), out.size());
}

TEST(BlockCompressorTest, BlocksDoNotShareState) {
    CursorBuffer out;
    BlockCompressor compressor(out, DEFAULT_COMPRESSION_LEVEL);

    auto data = patternBytes(3000);
    ASSERT_TRUE(compressor.write(data).ok());
    ASSERT_TRUE(compressor.write(data).ok());

    auto blocks = splitBlocks(out.bytes());
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].raw, blocks[1].raw);
}

TEST(BlockCompressorTest, EmptyWriteEmitsNothing) {
    CursorBuffer out;
    BlockCompressor compressor(out, DEFAULT_COMPRESSION_LEVEL);

    IoResult r = compressor.write({});
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.count, 0u);
    EXPECT_EQ(out.size(), 0u);
    EXPECT_EQ(compressor.blockCount(), 0u);
}

TEST(BlockCompressorTest, IncompressibleChunkThatFits) {
    CursorBuffer out;
    BlockCompressor compressor(out, DEFAULT_COMPRESSION_LEVEL);

    auto data = randomBytes(30000, 1);
    ASSERT_TRUE(compressor.write(data).ok());

    auto blocks = splitBlocks(out.bytes());
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_GT(blocks[0].payload.size(), data.size());
    EXPECT_EQ(inflatePayload(blocks[0].payload, data.size()), data);
}

TEST(BlockCompressorTest, OversizedChunkIsSplit) {
    CursorBuffer out;
    BlockCompressor compressor(out, DEFAULT_COMPRESSION_LEVEL);

    // Random data grows under deflate; a full chunk no longer fits the size field
    auto data = randomBytes(MAX_BLOCK_SIZE, 2);
    IoResult r = compressor.write(data);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.count, MAX_BLOCK_SIZE);
    EXPECT_EQ(compressor.sizeTotal(), MAX_BLOCK_SIZE);
    EXPECT_EQ(compressor.sizeWritten(), out.size());

    auto blocks = splitBlocks(out.data());
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(compressor.blockCount(), 2u);
    EXPECT_EQ(blocks[0].header.decompressedSize, MAX_BLOCK_SIZE / 2);
    EXPECT_EQ(blocks[1].header.decompressedSize, MAX_BLOCK_SIZE - MAX_BLOCK_SIZE / 2);

    std::vector<uint8_t> decoded;
    for (const auto& block : blocks) {
        EXPECT_LE(block.payload.size(), MAX_BLOCK_SIZE);
        auto part = inflatePayload(block.payload, block.header.decompressedSize);
        ASSERT_EQ(part.size(), block.header.decompressedSize);
        decoded.insert(decoded.end(), part.begin(), part.end());
    }
    EXPECT_EQ(decoded, data);
}

// ============================================================================
// Sink failures
// ============================================================================

TEST(BlockCompressorTest, SinkFailureReportsAbsorbedBytes) {
    LimitedSink sink(3);
    BlockCompressor compressor(sink, DEFAULT_COMPRESSION_LEVEL);

    auto data = patternBytes(100);
    IoResult r = compressor.write(data);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error, ErrorKind::SinkIOFailure);
    EXPECT_EQ(r.count, 100u);

    EXPECT_EQ(compressor.sizeWritten(), 3u);
    EXPECT_EQ(compressor.sizeTotal(), 100u);
    EXPECT_EQ(compressor.blockCount(), 1u);
}

TEST(BlockCompressorTest, EarlierBlocksStayWritten) {
    // First block compresses far below this limit; the second cannot fit
    CursorBuffer reference;
    BlockCompressor refCompressor(reference, DEFAULT_COMPRESSION_LEVEL);
    auto data = patternBytes(MAX_BLOCK_SIZE + 5000);
    ASSERT_TRUE(refCompressor.write(data).ok());
    auto refBlocks = splitBlocks(reference.bytes());
    ASSERT_EQ(refBlocks.size(), 2u);

    LimitedSink sink(refBlocks[0].raw.size() + 4);
    BlockCompressor compressor(sink, DEFAULT_COMPRESSION_LEVEL);

    IoResult r = compressor.write(data);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error, ErrorKind::SinkIOFailure);
    EXPECT_EQ(r.count, data.size());
    EXPECT_EQ(compressor.blockCount(), 2u);
    EXPECT_EQ(compressor.sizeWritten(), sink.received.size());

    std::vector<uint8_t> firstBlock(sink.received.begin(),
                                    sink.received.begin() + refBlocks[0].raw.size());
    EXPECT_EQ(firstBlock, refBlocks[0].raw);
}

// ============================================================================
// Construction
// ============================================================================

TEST(BlockCompressorTest, InvalidLevelThrows) {
    CursorBuffer out;
    try {
        BlockCompressor compressor(out, 42);
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CompressionFailure);
    }
}

TEST(BlockCompressorTest, LevelZeroStillRoundTrips) {
    CursorBuffer out;
    BlockCompressor compressor(out, 0);
    EXPECT_EQ(compressor.level(), 0);

    auto data = patternBytes(2000);
    ASSERT_TRUE(compressor.write(data).ok());

    auto blocks = splitBlocks(out.bytes());
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(inflatePayload(blocks[0].payload, data.size()), data);
}

TEST(BlockCompressorTest, FoldChecksum) {
    EXPECT_EQ(foldChecksum(0x12345678), 0x1234 ^ 0x5678);
    EXPECT_EQ(foldChecksum(0xFFFF0000), 0xFFFF);
    EXPECT_EQ(foldChecksum(0xABCDABCD), 0);

    // crc32("123456789") = 0xCBF43926
    std::vector<uint8_t> check = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    EXPECT_EQ(blockChecksum(check), 0xCBF4 ^ 0x3926);
}
