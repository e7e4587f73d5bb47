#include "replaypack/byte_stream.hpp"
#include <array>
#include <iostream>

namespace replaypack {

IoResult copyStream(ByteSink& dst, ByteSource& src) {
    std::array<uint8_t, 32 * 1024> chunk;
    size_t total = 0;

    for (;;) {
        IoResult r = src.read(chunk);
        if (r.count > 0) {
            IoResult w = dst.write(std::span<const uint8_t>(chunk.data(), r.count));
            total += w.count;
            if (!w) {
                return IoResult::failure(total, *w.error);
            }
        }
        if (!r) {
            return IoResult::failure(total, *r.error);
        }
        if (r.count == 0) {
            return IoResult::success(total);
        }
    }
}

IoResult OStreamSink::write(std::span<const uint8_t> data) {
    out_.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!out_.good()) {
        std::cerr << "[OStreamSink] write of " << data.size() << " bytes failed\n";
        return IoResult::failure(0, ErrorKind::SinkIOFailure);
    }
    return IoResult::success(data.size());
}

IoResult IStreamSource::read(std::span<uint8_t> dst) {
    if (dst.empty() || in_.eof()) {
        return IoResult::success(0);
    }

    in_.read(reinterpret_cast<char*>(dst.data()), static_cast<std::streamsize>(dst.size()));
    auto got = static_cast<size_t>(in_.gcount());

    if (in_.bad()) {
        std::cerr << "[IStreamSource] read failed after " << got << " bytes\n";
        return IoResult::failure(got, ErrorKind::SourceIOFailure);
    }
    return IoResult::success(got);
}

}  // namespace replaypack
