#pragma once

/**
 * @file errors.hpp
 * @brief Error kinds shared by the field codec and the block container
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace replaypack {

// Closed set of failure kinds. Callers switch over this instead of
// comparing messages.
enum class ErrorKind : uint8_t {
    BufferUnderrun,         // Typed read past the unread bytes
    InvalidIPv4,            // Address absent or not exactly 4 bytes
    InvalidSocketAddress,   // Family / padding inconsistency in a SockAddr record
    NoTerminatorFound,      // C string without a zero byte before buffer end
    CompressionFailure,     // zlib reported an error
    SinkIOFailure,          // ByteSink::write failed
    SourceIOFailure,        // ByteSource::read failed
    TruncatedBlock,         // Block header or payload cut short by end of stream
    ChecksumMismatch,       // Block header or data checksum does not match
};

// Stable name for logs and messages
[[nodiscard]] std::string_view errorKindName(ErrorKind kind);

// ============================================================================
// CodecError - thrown by CursorBuffer typed reads/writes
// ============================================================================

class CodecError : public std::runtime_error {
public:
    explicit CodecError(ErrorKind kind);
    CodecError(ErrorKind kind, const std::string& detail);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// ============================================================================
// IoResult - outcome of a streaming write or read
// ============================================================================
//
// count is the number of bytes processed before the operation stopped,
// which may be non-zero even when error is set.
//
struct IoResult {
    size_t count = 0;
    std::optional<ErrorKind> error;

    [[nodiscard]] static IoResult success(size_t n) { return IoResult{n, std::nullopt}; }
    [[nodiscard]] static IoResult failure(size_t n, ErrorKind kind) { return IoResult{n, kind}; }

    [[nodiscard]] bool ok() const { return !error.has_value(); }
    explicit operator bool() const { return ok(); }
};

}  // namespace replaypack
