#include "replaypack/block_compressor.hpp"
#include "replaypack/config.hpp"
#include <algorithm>
#include <iostream>

namespace replaypack {

namespace {

// Room for the sync flush marker and block boundaries beyond deflateBound()
constexpr size_t FLUSH_SLACK = 64;

int configuredCompressionLevel() {
    auto& config = ConfigManager::instance();
    return config.isInitialized() ? config.compressionLevel() : DEFAULT_COMPRESSION_LEVEL;
}

bool debugLogging() {
    auto& config = ConfigManager::instance();
    return config.isInitialized() && config.debugLogging();
}

}  // namespace

BlockCompressor::BlockCompressor(ByteSink& sink)
    : BlockCompressor(sink, configuredCompressionLevel())
{
}

BlockCompressor::BlockCompressor(ByteSink& sink, int level)
    : sink_(sink)
    , level_(level)
{
    int rc = deflateInit2(&zs_, level_, Z_DEFLATED, MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw CodecError(ErrorKind::CompressionFailure,
                         "deflateInit2 failed for level " + std::to_string(level_));
    }
}

BlockCompressor::~BlockCompressor() {
    deflateEnd(&zs_);
}

IoResult BlockCompressor::write(std::span<const uint8_t> data) {
    size_t n = 0;

    while (!data.empty()) {
        auto chunk = data.first(std::min(data.size(), MAX_BLOCK_SIZE));

        size_t absorbed = 0;
        bool oversized = false;
        IoResult r = writeBlock(chunk, absorbed, oversized);

        // Incompressible input can grow past the 16-bit size field; halve
        // the chunk until its payload fits. Nothing was emitted for it.
        while (oversized && chunk.size() > 1) {
            chunk = chunk.first(chunk.size() / 2);
            r = writeBlock(chunk, absorbed, oversized);
        }
        n += absorbed;

        if (!r) {
            return IoResult::failure(n, *r.error);
        }

        data = data.subspan(chunk.size());
    }

    return IoResult::success(n);
}

IoResult BlockCompressor::writeBlock(std::span<const uint8_t> chunk, size_t& absorbed,
                                     bool& oversized) {
    oversized = false;
    // Header with placeholders for size and checksums
    block_.truncate();
    block_.writeUInt16(0);
    block_.writeUInt16(static_cast<uint16_t>(chunk.size()));
    block_.writeUInt16(0);
    block_.writeUInt16(0);

    if (deflateReset(&zs_) != Z_OK) {
        std::cerr << "[BlockCompressor] deflateReset failed\n";
        return IoResult::failure(0, ErrorKind::CompressionFailure);
    }

    block_.ensureWritable(deflateBound(&zs_, static_cast<uLong>(chunk.size())) + FLUSH_SLACK);

    zs_.next_in = const_cast<Bytef*>(chunk.data());
    zs_.avail_in = static_cast<uInt>(chunk.size());

    bool ok = deflateInto(Z_NO_FLUSH);
    absorbed = chunk.size() - zs_.avail_in;
    if (ok) {
        ok = deflateInto(Z_SYNC_FLUSH);
    }
    if (!ok) {
        std::cerr << "[BlockCompressor] deflate failed: "
                  << (zs_.msg ? zs_.msg : "stream error") << "\n";
        return IoResult::failure(0, ErrorKind::CompressionFailure);
    }

    size_t payloadSize = block_.size() - BLOCK_HEADER_SIZE;
    if (payloadSize > MAX_BLOCK_SIZE) {
        // compressedSize is a uint16; the block cannot be described
        if (debugLogging()) {
            std::cerr << "[BlockCompressor] chunk of " << chunk.size() << " bytes deflated to "
                      << payloadSize << " bytes, splitting\n";
        }
        absorbed = 0;
        oversized = true;
        return IoResult::failure(0, ErrorKind::CompressionFailure);
    }

    block_.writeUInt16At(BlockField::COMPRESSED_SIZE, static_cast<uint16_t>(payloadSize));

    // Header checksum covers the patched sizes with both checksum fields still zero
    block_.writeUInt16At(BlockField::HEADER_CHECKSUM,
                         blockChecksum(block_.data().first(BLOCK_HEADER_SIZE)));
    block_.writeUInt16At(BlockField::DATA_CHECKSUM,
                         blockChecksum(block_.data().subspan(BLOCK_HEADER_SIZE)));

    IoResult w = sink_.write(block_.data());
    sizeWritten_ += static_cast<uint32_t>(w.count);
    sizeTotal_ += static_cast<uint32_t>(absorbed);
    blockCount_++;

    if (!w) {
        std::cerr << "[BlockCompressor] sink accepted " << w.count << " of "
                  << block_.size() << " bytes of block " << blockCount_ << ": "
                  << errorKindName(*w.error) << "\n";
        return IoResult::failure(w.count, *w.error);
    }

    if (debugLogging()) {
        std::cerr << "[BlockCompressor] block " << blockCount_ << ": "
                  << chunk.size() << " -> " << payloadSize << " bytes\n";
    }

    return IoResult::success(w.count);
}

bool BlockCompressor::deflateInto(int flush) {
    for (;;) {
        if (block_.writableBytes() < FLUSH_SLACK) {
            block_.ensureWritable(block_.capacity());
        }

        size_t room = block_.writableBytes();
        zs_.next_out = block_.writablePtr();
        zs_.avail_out = static_cast<uInt>(room);

        int rc = ::deflate(&zs_, flush);
        block_.advanceWrite(room - zs_.avail_out);

        // Z_BUF_ERROR only means no progress was possible; not fatal
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            return false;
        }

        if (flush == Z_NO_FLUSH) {
            if (zs_.avail_in == 0) {
                return true;
            }
        } else if (zs_.avail_out != 0) {
            return true;
        }
    }
}

}  // namespace replaypack
