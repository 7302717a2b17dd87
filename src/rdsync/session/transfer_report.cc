#include <rdsync/session/transfer_report.h>

namespace rdsync {

bool TransferReport::IsSuccess() const { return !aborted && failures.empty(); }

std::ostream &operator<<(std::ostream &os, const TransferReport &report) {
  os << "completed=" << report.completed.size()
     << " failed=" << report.failures.size()
     << " literal_bytes=" << report.stats.literal_bytes
     << " matched_bytes=" << report.stats.matched_bytes;
  if (report.aborted) {
    os << " aborted: " << report.abort_reason;
  }
  for (const auto &failure : report.failures) {
    os << "\n  " << failure.path << " (" << ToString(failure.kind)
       << "): " << failure.message;
  }
  return os;
}

}  // namespace rdsync
