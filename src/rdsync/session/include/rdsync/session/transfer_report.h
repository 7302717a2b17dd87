#ifndef RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_TRANSFER_REPORT_H
#define RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_TRANSFER_REPORT_H

#include <rdsync/common/errors.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace rdsync {

struct FileFailure {
  std::string path;
  FileErrorKind kind{};
  std::string message;
};

struct TransferStats {
  int64_t literal_bytes{};
  int64_t matched_bytes{};
  // as reported by the sender at the end of the session
  int64_t bytes_read{};
  int64_t bytes_written{};
  int64_t total_size{};
};

/**
 * Outcome of one session.
 *
 * On the receiver `completed` lists files written and verified; on the
 * sender it lists files streamed without a local read error.
 */
struct TransferReport {
  std::vector<std::string> completed;
  std::vector<FileFailure> failures;

  bool aborted{};
  std::string abort_reason;

  TransferStats stats;

  [[nodiscard]] bool IsSuccess() const;
};

std::ostream &operator<<(std::ostream &os, const TransferReport &report);

}  // namespace rdsync

#endif  // RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_TRANSFER_REPORT_H
