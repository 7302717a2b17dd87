#ifndef RDSYNC_SRC_CHECKSUMS_INCLUDE_RDSYNC_CHECKSUMS_STRONG_CHECKSUM_BUILDER_H
#define RDSYNC_SRC_CHECKSUMS_INCLUDE_RDSYNC_CHECKSUMS_STRONG_CHECKSUM_BUILDER_H

#include <rdsync/checksums/strong_checksum.h>

#include <memory>

struct XXH3_state_s;

namespace rdsync {

/**
 * Streaming form of StrongChecksum::Compute, used for whole-file digests.
 */
class StrongChecksumBuilder final {
  struct StateDeleter {
    void operator()(XXH3_state_s *state) const;
  };

  std::unique_ptr<XXH3_state_s, StateDeleter> state_;

public:
  explicit StrongChecksumBuilder(uint32_t seed);

  StrongChecksumBuilder(const StrongChecksumBuilder &) = delete;
  StrongChecksumBuilder &operator=(const StrongChecksumBuilder &) = delete;

  void Update(const void *buffer, std::streamsize size);

  [[nodiscard]] StrongChecksum Digest() const;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_CHECKSUMS_INCLUDE_RDSYNC_CHECKSUMS_STRONG_CHECKSUM_BUILDER_H
