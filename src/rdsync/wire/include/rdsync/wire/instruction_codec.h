#ifndef RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_INSTRUCTION_CODEC_H
#define RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_INSTRUCTION_CODEC_H

#include <rdsync/delta/instruction.h>
#include <rdsync/wire/byte_io.h>

namespace rdsync::wire {

enum class InstructionTag : uint8_t {
  kEnd = 0,
  kData = 1,
  kCopy = 2,
};

void WriteInstruction(ByteSink &sink, const Instruction &instruction);

/**
 * @param max_data upper bound for the size of a Data payload
 * @throws ProtocolError on an unknown tag or an oversized Data payload
 */
Instruction ReadInstruction(ByteSource &source, std::streamsize max_data);

}  // namespace rdsync::wire

#endif  // RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_INSTRUCTION_CODEC_H
