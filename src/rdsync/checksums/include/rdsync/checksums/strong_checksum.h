#ifndef RDSYNC_SRC_CHECKSUMS_INCLUDE_RDSYNC_CHECKSUMS_STRONG_CHECKSUM_H
#define RDSYNC_SRC_CHECKSUMS_INCLUDE_RDSYNC_CHECKSUMS_STRONG_CHECKSUM_H

#include <array>
#include <cstdint>
#include <istream>
#include <string>

namespace rdsync {

/**
 * A class for computing 128bit session-seeded strong checksums.
 * Current implementation uses XXH3-128 from https://github.com/Cyan4973/xxHash
 * with the session seed as the XXH3 seed. Seed 0 yields the plain XXH3-128.
 */
class StrongChecksum {
  uint64_t hi_;
  uint64_t lo_;

public:
  static constexpr std::streamsize kSize = 16;
  using Bytes = std::array<uint8_t, kSize>;

  StrongChecksum();

  StrongChecksum(uint64_t hi, uint64_t lo);

  static StrongChecksum
  Compute(uint32_t seed, const void *buffer, std::streamsize size);

  static StrongChecksum Compute(uint32_t seed, std::istream &input);

  // inverse of ToBytes()
  static StrongChecksum FromBytes(const Bytes &bytes);

  // big endian, high word first
  [[nodiscard]] Bytes ToBytes() const;

  bool operator==(const StrongChecksum &other) const;

  bool operator!=(const StrongChecksum &other) const;

  [[nodiscard]] std::string ToString() const;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_CHECKSUMS_INCLUDE_RDSYNC_CHECKSUMS_STRONG_CHECKSUM_H
