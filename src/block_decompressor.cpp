#include "replaypack/block_decompressor.hpp"
#include <array>
#include <iostream>

namespace replaypack {

BlockDecompressor::BlockDecompressor(ByteSource& source)
    : source_(source)
{
    if (inflateInit(&zs_) != Z_OK) {
        throw CodecError(ErrorKind::CompressionFailure, "inflateInit failed");
    }
}

BlockDecompressor::~BlockDecompressor() {
    inflateEnd(&zs_);
}

IoResult BlockDecompressor::readFull(std::span<uint8_t> dst) {
    size_t got = 0;
    while (got < dst.size()) {
        IoResult r = source_.read(dst.subspan(got));
        got += r.count;
        if (!r) {
            return IoResult::failure(got, *r.error);
        }
        if (r.count == 0) {
            break;
        }
    }
    return IoResult::success(got);
}

IoResult BlockDecompressor::readBlock(CursorBuffer& out) {
    if (eof_) {
        return IoResult::success(0);
    }

    std::array<uint8_t, BLOCK_HEADER_SIZE> raw;
    IoResult h = readFull(raw);
    sizeRead_ += static_cast<uint32_t>(h.count);
    if (!h) {
        return IoResult::failure(0, *h.error);
    }
    if (h.count == 0) {
        eof_ = true;
        return IoResult::success(0);
    }
    if (h.count < BLOCK_HEADER_SIZE) {
        std::cerr << "[BlockDecompressor] stream ends inside header of block "
                  << blockCount_ + 1 << "\n";
        return IoResult::failure(0, ErrorKind::TruncatedBlock);
    }

    BlockHeader header = BlockHeader::parse(raw);
    if (header.headerChecksum != header.expectedHeaderChecksum()) {
        std::cerr << "[BlockDecompressor] header checksum mismatch in block "
                  << blockCount_ + 1 << "\n";
        return IoResult::failure(0, ErrorKind::ChecksumMismatch);
    }

    payload_.resize(header.compressedSize);
    IoResult p = readFull(payload_);
    sizeRead_ += static_cast<uint32_t>(p.count);
    if (!p) {
        return IoResult::failure(0, *p.error);
    }
    if (p.count < payload_.size()) {
        std::cerr << "[BlockDecompressor] stream ends inside payload of block "
                  << blockCount_ + 1 << " (" << p.count << " of "
                  << payload_.size() << " bytes)\n";
        return IoResult::failure(0, ErrorKind::TruncatedBlock);
    }

    if (blockChecksum(payload_) != header.dataChecksum) {
        std::cerr << "[BlockDecompressor] data checksum mismatch in block "
                  << blockCount_ + 1 << "\n";
        return IoResult::failure(0, ErrorKind::ChecksumMismatch);
    }

    if (inflateReset(&zs_) != Z_OK) {
        return IoResult::failure(0, ErrorKind::CompressionFailure);
    }

    // One spare byte so a payload that inflates to more than the header
    // claims is detected rather than silently cut off
    size_t expected = header.decompressedSize;
    out.ensureWritable(expected + 1);

    zs_.next_in = payload_.data();
    zs_.avail_in = static_cast<uInt>(payload_.size());
    zs_.next_out = out.writablePtr();
    zs_.avail_out = static_cast<uInt>(expected + 1);

    int rc = inflate(&zs_, Z_SYNC_FLUSH);
    size_t produced = expected + 1 - zs_.avail_out;

    if ((rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) || produced != expected) {
        std::cerr << "[BlockDecompressor] inflate of block " << blockCount_ + 1
                  << " produced " << produced << " of " << expected << " bytes: "
                  << (zs_.msg ? zs_.msg : "size mismatch") << "\n";
        return IoResult::failure(0, ErrorKind::CompressionFailure);
    }

    out.advanceWrite(produced);
    sizeTotal_ += static_cast<uint32_t>(produced);
    blockCount_++;
    return IoResult::success(produced);
}

IoResult BlockDecompressor::read(std::span<uint8_t> dst) {
    while (pending_.empty()) {
        if (eof_) {
            return IoResult::success(0);
        }
        pending_.truncate();
        IoResult r = readBlock(pending_);
        if (!r) {
            return IoResult::failure(0, *r.error);
        }
    }
    return pending_.read(dst);
}

}  // namespace replaypack
