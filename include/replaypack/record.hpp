#pragma once

/**
 * @file record.hpp
 * @brief Replay record interface and the encoder that serializes records
 */

#include "replaypack/byte_stream.hpp"
#include "replaypack/cursor_buffer.hpp"
#include <cstdint>

namespace replaypack {

// A structured replay record. Concrete record types live with the replay
// format layer; this library only needs the type id and the body.
class Record {
public:
    virtual ~Record() = default;

    // One-byte record type id written ahead of the body
    [[nodiscard]] virtual uint8_t recordType() const = 0;

    // Append the record body to buf
    virtual void serialize(CursorBuffer& buf) const = 0;
};

// Turns a record into bytes on a sink
class RecordEncoder {
public:
    virtual ~RecordEncoder() = default;

    // Serialize record and write it to sink. Returns the bytes written, or
    // the sink's error.
    virtual IoResult encode(ByteSink& sink, const Record& record) = 0;
};

// Default encoder: [type id][body], built in a reused scratch buffer and
// handed to the sink in one write.
class PacketRecordEncoder : public RecordEncoder {
public:
    IoResult encode(ByteSink& sink, const Record& record) override;

private:
    CursorBuffer scratch_;
};

}  // namespace replaypack
