#include <rdsync/readers/memory_reader.h>

#include <algorithm>
#include <cstring>

namespace rdsync {

MemoryReader::MemoryReader(const void *data, std::streamsize data_size)
    : data_(data),
      data_size_(data_size) {}

MemoryReader::MemoryReader(std::string data)
    : owned_(std::move(data)),
      data_(owned_.data()),
      data_size_(static_cast<std::streamsize>(owned_.size())) {}

std::streamsize MemoryReader::GetSize() const { return data_size_; }

std::streamsize
MemoryReader::Read(void *buffer, std::streamoff offset, std::streamsize size) {
  auto limit = std::min<std::streamoff>(data_size_, offset + size);
  auto count = offset < limit ? limit - offset : 0;

  if (count > 0) {
    memcpy(buffer, static_cast<const char *>(data_) + offset, count);
  }

  // make sure the metrics are captured!
  return Reader::Read(buffer, offset, count);
}

}  // namespace rdsync
