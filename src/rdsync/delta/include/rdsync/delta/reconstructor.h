#ifndef RDSYNC_SRC_DELTA_INCLUDE_RDSYNC_DELTA_RECONSTRUCTOR_H
#define RDSYNC_SRC_DELTA_INCLUDE_RDSYNC_DELTA_RECONSTRUCTOR_H

#include <rdsync/checksums/strong_checksum_builder.h>
#include <rdsync/common/metrics.h>
#include <rdsync/delta/instruction.h>
#include <rdsync/readers/reader.h>
#include <rdsync/signature/signature_table.h>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace rdsync {

/**
 * Receiver side of the delta transfer.
 *
 * Applies instructions in order against the basis the signature table was
 * built from and writes the new file to `output`. The seeded digest of the
 * written bytes is kept so the caller can verify it against the sender's.
 */
class Reconstructor final : public metrics::MetricContainer {
  const SignatureTable &table_;
  Reader *basis_;
  std::ostream &output_;

  StrongChecksumBuilder digest_;
  std::optional<StrongChecksumBuilder> unseeded_digest_;
  std::vector<char> buffer_;
  std::streamsize written_{};
  bool finished_{};

  metrics::Metric copied_bytes_{};
  metrics::Metric literal_bytes_{};

  void Write(const char *data, std::streamsize size);

  void ApplyCopy(const Instruction &instruction);

public:
  /**
   * @param basis may be null when the table has no blocks
   */
  Reconstructor(
      const SignatureTable &table,
      Reader *basis,
      std::ostream &output);

  /**
   * @throws ReconstructionError on a Copy that does not fit the table or an
   *         instruction after End
   * @throws IoError if the basis cannot be read or the output written
   */
  void Apply(const Instruction &instruction);

  [[nodiscard]] bool IsFinished() const;

  [[nodiscard]] std::streamsize GetWrittenSize() const;

  [[nodiscard]] StrongChecksum GetDigest() const;

  // also hash the output with seed 0, must precede the first Apply()
  void TrackUnseededDigest();

  [[nodiscard]] StrongChecksum GetUnseededDigest() const;

  // @throws IntegrityError when the written data does not hash to `expected`
  void Verify(const StrongChecksum &expected) const;

  void Accept(metrics::MetricVisitor &visitor) override;

  static std::string Apply(
      const std::string &old_data,
      const SignatureTable &table,
      const std::vector<Instruction> &instructions);
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_DELTA_INCLUDE_RDSYNC_DELTA_RECONSTRUCTOR_H
