#include <rdsync/delta/instruction.h>

namespace rdsync {

Instruction Instruction::Copy(uint32_t block_index, uint32_t byte_len) {
  Instruction result;
  result.kind = Kind::kCopy;
  result.block_index = block_index;
  result.byte_len = byte_len;
  return result;
}

Instruction Instruction::Data(std::string data) {
  Instruction result;
  result.kind = Kind::kData;
  result.data = std::move(data);
  return result;
}

Instruction Instruction::End() { return {}; }

std::ostream &operator<<(std::ostream &os, const Instruction &instruction) {
  switch (instruction.kind) {
    case Instruction::Kind::kEnd:
      return os << "End";
    case Instruction::Kind::kData:
      if (instruction.data.size() <= 16) {
        return os << "Data(\"" << instruction.data << "\")";
      }
      return os << "Data(" << instruction.data.size() << " bytes)";
    case Instruction::Kind::kCopy:
      return os << "Copy(" << instruction.block_index << ", "
                << instruction.byte_len << ")";
  }
  return os << "?";
}

}  // namespace rdsync
