#include <rdsync/readers/reader.h>

namespace rdsync {

std::streamsize Reader::Read(
    void * /*buffer*/,
    std::streamoff /*offset*/,
    std::streamsize size) {
  total_reads_++;
  total_bytes_read_ += size;
  return size;
}

void Reader::Accept(metrics::MetricVisitor &visitor) {
  RDSYNC_VISIT_METRIC(total_reads_);
  RDSYNC_VISIT_METRIC(total_bytes_read_);
}

}  // namespace rdsync
