#include "replaypack/record.hpp"

namespace replaypack {

IoResult PacketRecordEncoder::encode(ByteSink& sink, const Record& record) {
    scratch_.truncate();
    scratch_.writeUInt8(record.recordType());
    record.serialize(scratch_);
    return sink.write(scratch_.bytes());
}

}  // namespace replaypack
