#include <glog/logging.h>
#include <rdsync/checksums/rolling_checksum.h>

// https://rsync.samba.org/tech_report/node3.html

namespace rdsync {

RollingChecksum::RollingChecksum(const void *buffer, std::streamsize size) {
  Reset(buffer, size);
}

void RollingChecksum::Reset(const void *buffer, std::streamsize size) {
  CHECK_GE(size, 0);
  const auto *data = static_cast<const uint8_t *>(buffer);

  uint32_t a = 0;
  uint32_t b = 0;

  for (std::streamsize i = 0; i < size; i++) {
    a += data[i];
    b += static_cast<uint32_t>(size - i) * data[i];
  }

  a_ = static_cast<uint16_t>(a);
  b_ = static_cast<uint16_t>(b);
  size_ = static_cast<uint32_t>(size);
}

void RollingChecksum::Roll(uint8_t leaving, uint8_t entering) {
  a_ = static_cast<uint16_t>(a_ - leaving + entering);
  b_ = static_cast<uint16_t>(b_ - size_ * leaving + a_);
}

void RollingChecksum::RollOut(uint8_t leaving) {
  CHECK_GT(size_, 0U);
  a_ = static_cast<uint16_t>(a_ - leaving);
  b_ = static_cast<uint16_t>(b_ - size_ * leaving);
  size_--;
}

uint32_t RollingChecksum::Value() const {
  return static_cast<uint32_t>(b_) << 16 | a_;
}

std::streamsize RollingChecksum::GetWindowSize() const { return size_; }

uint32_t RollingChecksum::Compute(const void *buffer, std::streamsize size) {
  return RollingChecksum(buffer, size).Value();
}

}  // namespace rdsync
