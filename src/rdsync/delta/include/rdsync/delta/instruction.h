#ifndef RDSYNC_SRC_DELTA_INCLUDE_RDSYNC_DELTA_INSTRUCTION_H
#define RDSYNC_SRC_DELTA_INCLUDE_RDSYNC_DELTA_INSTRUCTION_H

#include <cstdint>
#include <ostream>
#include <string>

namespace rdsync {

/**
 * One step of a delta: copy a block of the basis, insert literal bytes, or
 * end the stream.
 */
struct Instruction {
  enum class Kind : uint8_t {
    kEnd,
    kData,
    kCopy,
  };

  Kind kind{Kind::kEnd};

  // kCopy only
  uint32_t block_index{};
  uint32_t byte_len{};

  // kData only
  std::string data;

  static Instruction Copy(uint32_t block_index, uint32_t byte_len);
  static Instruction Data(std::string data);
  static Instruction End();

  bool operator==(const Instruction &other) const = default;
};

std::ostream &operator<<(std::ostream &os, const Instruction &instruction);

}  // namespace rdsync

#endif  // RDSYNC_SRC_DELTA_INCLUDE_RDSYNC_DELTA_INSTRUCTION_H
