#ifndef RDSYNC_SRC_READERS_INCLUDE_RDSYNC_READERS_READER_H
#define RDSYNC_SRC_READERS_INCLUDE_RDSYNC_READERS_READER_H

#include <rdsync/common/metrics.h>

#include <ios>

namespace rdsync {

/**
 * Random access byte source. Basis files (receiver) and source files
 * (sender) are both consumed through this interface so a storage backend can
 * stand in for the local filesystem.
 */
class Reader : public metrics::MetricContainer {
  metrics::Metric total_reads_{};
  metrics::Metric total_bytes_read_{};

public:
  ~Reader() override = default;

  [[nodiscard]] virtual std::streamsize GetSize() const = 0;

  /**
   * reads up to `size` bytes at `offset`
   * @return the number of bytes read; short only at the end of data
   * @throws IoError when the underlying storage fails
   */
  virtual std::streamsize
  Read(void *buffer, std::streamoff offset, std::streamsize size);

  void Accept(metrics::MetricVisitor &visitor) override;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_READERS_INCLUDE_RDSYNC_READERS_READER_H
