#include "replaypack/errors.hpp"

namespace replaypack {

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BufferUnderrun:       return "buffer underrun";
        case ErrorKind::InvalidIPv4:          return "invalid IPv4 address";
        case ErrorKind::InvalidSocketAddress: return "invalid socket address";
        case ErrorKind::NoTerminatorFound:    return "no C string terminator found";
        case ErrorKind::CompressionFailure:   return "compression failure";
        case ErrorKind::SinkIOFailure:        return "sink I/O failure";
        case ErrorKind::SourceIOFailure:      return "source I/O failure";
        case ErrorKind::TruncatedBlock:       return "truncated block";
        case ErrorKind::ChecksumMismatch:     return "checksum mismatch";
    }
    return "unknown error";
}

CodecError::CodecError(ErrorKind kind)
    : std::runtime_error(std::string(errorKindName(kind)))
    , kind_(kind)
{
}

CodecError::CodecError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(errorKindName(kind)) + ": " + detail)
    , kind_(kind)
{
}

}  // namespace replaypack
