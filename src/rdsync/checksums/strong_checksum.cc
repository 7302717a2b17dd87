#include <rdsync/checksums/strong_checksum.h>
#include <rdsync/checksums/strong_checksum_builder.h>
#include <xxhash.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace rdsync {

StrongChecksum::StrongChecksum() : StrongChecksum(0, 0) {}

StrongChecksum::StrongChecksum(uint64_t hi, uint64_t lo) : hi_(hi), lo_(lo) {}

StrongChecksum StrongChecksum::Compute(
    uint32_t seed,
    const void *buffer,
    std::streamsize size) {
  auto digest = XXH3_128bits_withSeed(buffer, size, seed);

  return {digest.high64, digest.low64};
}

StrongChecksum StrongChecksum::Compute(uint32_t seed, std::istream &input) {
  static constexpr std::streamsize kBufSize = 64 * 1024;

  std::vector<char> buffer(kBufSize);
  StrongChecksumBuilder builder(seed);

  while (input) {
    input.read(buffer.data(), kBufSize);
    builder.Update(buffer.data(), input.gcount());
  }

  return builder.Digest();
}

StrongChecksum StrongChecksum::FromBytes(const Bytes &bytes) {
  uint64_t hi = 0;
  uint64_t lo = 0;
  for (int i = 0; i < 8; i++) {
    hi = hi << 8 | bytes[i];
    lo = lo << 8 | bytes[8 + i];
  }
  return {hi, lo};
}

StrongChecksum::Bytes StrongChecksum::ToBytes() const {
  Bytes result{};
  for (int i = 0; i < 8; i++) {
    result[7 - i] = static_cast<uint8_t>(hi_ >> (8 * i));
    result[15 - i] = static_cast<uint8_t>(lo_ >> (8 * i));
  }
  return result;
}

bool StrongChecksum::operator==(const StrongChecksum &other) const {
  return hi_ == other.hi_ && lo_ == other.lo_;
}

bool StrongChecksum::operator!=(const StrongChecksum &other) const {
  return !(*this == other);
}

std::string StrongChecksum::ToString() const {
  std::stringstream s;
  s << std::hex << std::setfill('0') << std::setw(16) << hi_ << std::setw(16)
    << lo_;
  return s.str();
}

}  // namespace rdsync
