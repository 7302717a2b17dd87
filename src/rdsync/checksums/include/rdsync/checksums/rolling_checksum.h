#ifndef RDSYNC_SRC_CHECKSUMS_INCLUDE_RDSYNC_CHECKSUMS_ROLLING_CHECKSUM_H
#define RDSYNC_SRC_CHECKSUMS_INCLUDE_RDSYNC_CHECKSUMS_ROLLING_CHECKSUM_H

#include <cstdint>
#include <ios>

namespace rdsync {

/**
 * rsync weak checksum over a sliding window.
 *
 * For a window x[0..k) of unsigned bytes:
 *   a = sum(x[i])             mod 2^16
 *   b = sum((k - i) * x[i])   mod 2^16
 *   value = a + (b << 16)
 *
 * Roll() and RollOut() update the state in constant time; the state always
 * describes the exact current window.
 */
class RollingChecksum final {
  uint16_t a_{};
  uint16_t b_{};
  uint32_t size_{};

public:
  RollingChecksum() = default;

  RollingChecksum(const void *buffer, std::streamsize size);

  void Reset(const void *buffer, std::streamsize size);

  /**
   * slides the window one byte forward
   * @param leaving the first byte of the current window
   * @param entering the byte right after the current window
   */
  void Roll(uint8_t leaving, uint8_t entering);

  /**
   * drops the first byte of the window without taking in a new one.
   * used at the tail of the input where the window shrinks.
   */
  void RollOut(uint8_t leaving);

  [[nodiscard]] uint32_t Value() const;

  [[nodiscard]] std::streamsize GetWindowSize() const;

  static uint32_t Compute(const void *buffer, std::streamsize size);
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_CHECKSUMS_INCLUDE_RDSYNC_CHECKSUMS_ROLLING_CHECKSUM_H
