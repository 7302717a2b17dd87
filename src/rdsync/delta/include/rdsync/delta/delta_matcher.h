#ifndef RDSYNC_SRC_DELTA_INCLUDE_RDSYNC_DELTA_DELTA_MATCHER_H
#define RDSYNC_SRC_DELTA_INCLUDE_RDSYNC_DELTA_DELTA_MATCHER_H

#include <rdsync/checksums/rolling_checksum.h>
#include <rdsync/checksums/strong_checksum_builder.h>
#include <rdsync/common/metrics.h>
#include <rdsync/delta/instruction.h>
#include <rdsync/readers/reader.h>
#include <rdsync/signature/signature_table.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rdsync {

/**
 * Sender side of the delta transfer.
 *
 * Slides a block sized window over the new data one byte at a time and
 * emits Copy for every window whose weak and strong sums match a block of
 * the basis signature (earliest block index wins), Data for everything else.
 * The stream always ends with End.
 *
 * The input is pulled from a Reader in chunks. Memory use is bounded by
 * max_literal + block_len + one read chunk.
 */
class DeltaMatcher final : public metrics::MetricContainer {
public:
  using Sink = std::function<void(const Instruction &)>;

  static constexpr std::streamsize kDefaultMaxLiteral = 32 * 1024;

  explicit DeltaMatcher(
      const SignatureTable &table,
      std::streamsize max_literal = kDefaultMaxLiteral);

  /**
   * consumes `input` front to back, can be called once
   * @throws IoError if the input cannot be read
   */
  void Run(Reader &input, const Sink &sink);

  // seeded digest of everything Run() consumed
  [[nodiscard]] StrongChecksum GetDigest() const;

  void Accept(metrics::MetricVisitor &visitor) override;

  static std::vector<Instruction> Encode(
      const std::string &data,
      const SignatureTable &table,
      std::streamsize max_literal = kDefaultMaxLiteral);

private:
  static constexpr std::streamsize kReadChunk = 64 * 1024;

  const SignatureTable &table_;
  std::streamsize max_literal_;

  Reader *input_{};
  std::streamsize size_{};

  std::vector<char> buffer_;
  std::streamoff buffer_offset_{};
  std::streamoff buffer_end_{};

  // [literal_, window_) is pending literal data
  std::streamoff literal_{};
  std::streamoff window_{};

  StrongChecksumBuilder digest_;
  bool done_{};

  metrics::Metric weak_checksum_matches_{};
  metrics::Metric weak_checksum_false_positives_{};
  metrics::Metric strong_checksum_matches_{};
  metrics::Metric literal_bytes_{};
  metrics::Metric matched_bytes_{};

  // makes sure [literal_, end) is in the buffer
  void Ensure(std::streamoff end);

  [[nodiscard]] const char *At(std::streamoff offset) const;

  void FlushLiteral(const Sink &sink);

  std::optional<uint32_t> FindMatch(uint32_t weak, std::streamsize window_len);

  void RunLiteralOnly(const Sink &sink);
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_DELTA_INCLUDE_RDSYNC_DELTA_DELTA_MATCHER_H
