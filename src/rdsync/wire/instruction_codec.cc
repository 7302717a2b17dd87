#include <rdsync/common/errors.h>
#include <rdsync/wire/instruction_codec.h>

namespace rdsync::wire {

void WriteInstruction(ByteSink &sink, const Instruction &instruction) {
  switch (instruction.kind) {
    case Instruction::Kind::kEnd:
      WriteU8(sink, static_cast<uint8_t>(InstructionTag::kEnd));
      break;
    case Instruction::Kind::kData:
      WriteU8(sink, static_cast<uint8_t>(InstructionTag::kData));
      WriteVarint(sink, instruction.data.size());
      WriteBytes(
          sink,
          instruction.data.data(),
          static_cast<std::streamsize>(instruction.data.size()));
      break;
    case Instruction::Kind::kCopy:
      WriteU8(sink, static_cast<uint8_t>(InstructionTag::kCopy));
      WriteVarint(sink, instruction.block_index);
      WriteVarint(sink, instruction.byte_len);
      break;
  }
}

Instruction ReadInstruction(ByteSource &source, std::streamsize max_data) {
  auto tag = ReadU8(source);
  switch (static_cast<InstructionTag>(tag)) {
    case InstructionTag::kEnd:
      return Instruction::End();
    case InstructionTag::kData: {
      auto size = ReadVarint(source);
      if (size > static_cast<uint64_t>(max_data)) {
        throw ProtocolError(
            "literal of " + std::to_string(size) + " bytes exceeds limit of " +
            std::to_string(max_data));
      }
      return Instruction::Data(
          ReadBytes(source, static_cast<std::streamsize>(size)));
    }
    case InstructionTag::kCopy: {
      auto block_index = ReadVarint32(source);
      auto byte_len = ReadVarint32(source);
      return Instruction::Copy(block_index, byte_len);
    }
  }
  throw ProtocolError(
      "unknown instruction tag " + std::to_string(static_cast<int>(tag)));
}

}  // namespace rdsync::wire
