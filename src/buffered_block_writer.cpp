#include "replaypack/buffered_block_writer.hpp"
#include "replaypack/config.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace replaypack {

namespace {

size_t configuredBufferSize() {
    auto& config = ConfigManager::instance();
    return config.isInitialized() ? config.writerBufferSize() : DEFAULT_WRITER_BUFFER_SIZE;
}

}  // namespace

BufferedBlockWriter::BufferedBlockWriter(ByteSink& sink)
    : BufferedBlockWriter(sink, configuredBufferSize())
{
}

BufferedBlockWriter::BufferedBlockWriter(ByteSink& sink, size_t capacity,
                                         std::unique_ptr<RecordEncoder> encoder)
    : compressor_(sink)
    , encoder_(std::move(encoder))
{
    if (capacity == 0) {
        throw std::invalid_argument("BufferedBlockWriter capacity must be positive");
    }
    buffer_.resize(capacity);

    if (!encoder_) {
        encoder_ = std::make_unique<PacketRecordEncoder>();
    }
}

IoResult BufferedBlockWriter::write(std::span<const uint8_t> data) {
    if (error_) {
        return IoResult::failure(0, *error_);
    }

    size_t n = 0;
    while (!data.empty()) {
        size_t take = std::min(available(), data.size());
        std::memcpy(buffer_.data() + buffered_, data.data(), take);
        buffered_ += take;
        n += take;
        data = data.subspan(take);

        if (available() == 0) {
            IoResult r = flush();
            if (!r) {
                return IoResult::failure(n, *r.error);
            }
        }
    }

    return IoResult::success(n);
}

IoResult BufferedBlockWriter::writeRecord(const Record& record) {
    if (error_) {
        return IoResult::failure(0, *error_);
    }
    return encoder_->encode(*this, record);
}

IoResult BufferedBlockWriter::writeRecords(std::span<const Record* const> records) {
    size_t n = 0;
    for (const Record* record : records) {
        IoResult r = writeRecord(*record);
        n += r.count;
        if (!r) {
            return IoResult::failure(n, *r.error);
        }
    }
    return IoResult::success(n);
}

IoResult BufferedBlockWriter::flush() {
    if (error_) {
        return IoResult::failure(0, *error_);
    }
    if (buffered_ == 0) {
        return IoResult::success(0);
    }

    IoResult r = compressor_.write(std::span<const uint8_t>(buffer_.data(), buffered_));
    if (!r) {
        error_ = r.error;
        std::cerr << "[BufferedBlockWriter] flush of " << buffered_ << " bytes failed: "
                  << errorKindName(*r.error) << "\n";
        return r;
    }

    buffered_ = 0;
    return r;
}

IoResult BufferedBlockWriter::close() {
    if (error_) {
        return IoResult::failure(0, *error_);
    }

    size_t real = buffered_;
    size_t pad = available();
    if (real == 0 || pad == 0) {
        return flush();
    }

    std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(real), buffer_.end(), uint8_t{0});
    buffered_ = buffer_.size();

    uint32_t totalBefore = compressor_.sizeTotal();
    IoResult r = flush();

    // Padding sits at the end of the chunk; whatever of it was absorbed is
    // not payload
    uint32_t absorbed = compressor_.sizeTotal() - totalBefore;
    if (absorbed > real) {
        compressor_.excludePadding(static_cast<uint32_t>(std::min<size_t>(absorbed - real, pad)));
    }

    return r;
}

}  // namespace replaypack
