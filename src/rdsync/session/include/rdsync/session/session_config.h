#ifndef RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_SESSION_CONFIG_H
#define RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_SESSION_CONFIG_H

#include <rdsync/delta/delta_matcher.h>
#include <rdsync/signature/block_size.h>

#include <cstdint>
#include <ios>

namespace rdsync {

constexpr int32_t kProtocolVersion = 27;

struct SessionConfig {
  // the only version spoken; other values exist to exercise the mismatch
  int32_t protocol_version = kProtocolVersion;

  BlockSizePolicy block_size;

  // significant bytes of each block's strong checksum, 1..16
  uint8_t strong_len = 16;

  // sender: longest Data instruction emitted
  std::streamsize max_literal = DeltaMatcher::kDefaultMaxLiteral;

  // longest frame payload sent or accepted
  std::streamsize max_frame_payload = 32 * 1024;

  // sender: 0 picks a random seed per session
  uint32_t checksum_seed = 0;

  // upper bounds on what the peer may announce
  uint32_t max_block_count = 1U << 24;
  std::streamsize max_file_list_bytes = 64 * 1024 * 1024;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_SESSION_CONFIG_H
