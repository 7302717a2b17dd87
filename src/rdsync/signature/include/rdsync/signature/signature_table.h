#ifndef RDSYNC_SRC_SIGNATURE_INCLUDE_RDSYNC_SIGNATURE_SIGNATURE_TABLE_H
#define RDSYNC_SRC_SIGNATURE_INCLUDE_RDSYNC_SIGNATURE_SIGNATURE_TABLE_H

#include <rdsync/checksums/strong_checksum.h>
#include <rdsync/readers/reader.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace rdsync {

struct Block {
  uint32_t index{};
  uint32_t weak{};
  // only the first strong_len bytes are significant, the rest are zero
  StrongChecksum::Bytes strong{};
};

/**
 * Block signatures of one basis file.
 *
 * The file is cut into `block_len` sized blocks, the last one truncated to
 * `remainder_len` (0 when the size is a multiple of `block_len`).
 * Immutable once constructed.
 */
class SignatureTable final {
  uint32_t seed_;
  uint32_t block_len_;
  uint32_t remainder_len_;
  uint8_t strong_len_;

  std::vector<Block> blocks_;
  std::unordered_map<uint32_t, std::vector<uint32_t>> weak_to_candidates_;

  void Validate() const;

public:
  static constexpr uint8_t kMaxStrongLen = StrongChecksum::kSize;

  /**
   * @throws ProtocolError if the description is inconsistent
   *         (non contiguous indices, remainder not shorter than a block...)
   */
  SignatureTable(
      uint32_t seed,
      uint32_t block_len,
      uint32_t remainder_len,
      uint8_t strong_len,
      std::vector<Block> blocks);

  /**
   * reads `reader` once, front to back
   * @throws IoError if the reader fails
   */
  static SignatureTable Build(
      Reader &reader,
      uint32_t block_len,
      uint32_t seed,
      uint8_t strong_len = kMaxStrongLen);

  static SignatureTable Build(
      const std::string &data,
      uint32_t block_len,
      uint32_t seed,
      uint8_t strong_len = kMaxStrongLen);

  [[nodiscard]] uint32_t GetSeed() const;
  [[nodiscard]] uint32_t GetBlockLength() const;
  [[nodiscard]] uint32_t GetRemainderLength() const;
  [[nodiscard]] uint8_t GetStrongLength() const;
  [[nodiscard]] uint32_t GetBlockCount() const;
  [[nodiscard]] const std::vector<Block> &GetBlocks() const;

  // size of the file the table describes
  [[nodiscard]] std::streamsize GetFileSize() const;

  // length of block `index`, the last one may be short
  [[nodiscard]] uint32_t GetBlockLength(uint32_t index) const;

  [[nodiscard]] std::streamoff GetBlockOffset(uint32_t index) const;

  // indices sharing `weak`, ascending; nullptr when there are none
  [[nodiscard]] const std::vector<uint32_t> *FindCandidates(
      uint32_t weak) const;

  // compares the significant prefix of the block's strong sum
  [[nodiscard]] bool StrongEquals(
      uint32_t index,
      const StrongChecksum::Bytes &strong) const;

  // truncates a full digest to the table's strong length
  [[nodiscard]] StrongChecksum::Bytes Truncate(
      const StrongChecksum &checksum) const;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_SIGNATURE_INCLUDE_RDSYNC_SIGNATURE_SIGNATURE_TABLE_H
