#pragma once

/**
 * @file byte_stream.hpp
 * @brief Byte sink/source interfaces and std::iostream adapters
 */

#include "replaypack/errors.hpp"
#include <cstdint>
#include <istream>
#include <ostream>
#include <span>

namespace replaypack {

// Destination for bytes (file, socket, buffer, compressor, ...)
class ByteSink {
public:
    virtual ~ByteSink() = default;

    // Write all of data; count < data.size() only together with an error
    virtual IoResult write(std::span<const uint8_t> data) = 0;
};

// Origin of bytes. A result of {0, no error} means end of stream.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Read up to dst.size() bytes into dst
    virtual IoResult read(std::span<uint8_t> dst) = 0;
};

// Copy src into dst until src reports end of stream or either side fails.
// Returns the number of bytes written to dst.
IoResult copyStream(ByteSink& dst, ByteSource& src);

// ============================================================================
// std::iostream adapters
// ============================================================================

class OStreamSink : public ByteSink {
public:
    explicit OStreamSink(std::ostream& out) : out_(out) {}

    IoResult write(std::span<const uint8_t> data) override;

private:
    std::ostream& out_;
};

class IStreamSource : public ByteSource {
public:
    explicit IStreamSource(std::istream& in) : in_(in) {}

    IoResult read(std::span<uint8_t> dst) override;

private:
    std::istream& in_;
};

}  // namespace replaypack
