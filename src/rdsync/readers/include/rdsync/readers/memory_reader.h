#ifndef RDSYNC_SRC_READERS_INCLUDE_RDSYNC_READERS_MEMORY_READER_H
#define RDSYNC_SRC_READERS_INCLUDE_RDSYNC_READERS_MEMORY_READER_H

#include <rdsync/readers/reader.h>

#include <string>

namespace rdsync {

class MemoryReader final : public Reader {
  std::string owned_;
  const void *data_;
  std::streamsize data_size_;

public:
  // the caller keeps `data` alive for the lifetime of the reader
  MemoryReader(const void *data, std::streamsize data_size);

  explicit MemoryReader(std::string data);

  [[nodiscard]] std::streamsize GetSize() const override;

  std::streamsize
  Read(void *buffer, std::streamoff offset, std::streamsize size) override;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_READERS_INCLUDE_RDSYNC_READERS_MEMORY_READER_H
